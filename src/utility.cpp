/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "utility.hpp"

// standard
#include <atomic>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace logging {
    // ANSI color codes
    const std::string RESET = "\033[0m";
    const std::string YELLOW = "\033[33m";
    const std::string RED = "\033[31m";

    // workers log concurrently
    static std::mutex log_mutex;
    static std::atomic<bool> quiet{false};
    static std::atomic<bool> show_progress{false};

    // Internal helper to get timestamp
    static std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t current_time = std::chrono::system_clock::to_time_t(now);
        std::tm local_time{};
        localtime_r(&current_time, &local_time);
        std::stringstream ss;
        ss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    void info(const std::string& message) {
        if (quiet) return;
        std::lock_guard<std::mutex> lock(log_mutex);
        std::cout << "[RINDEX] " << get_timestamp() << " - " << message << std::endl;
    }

    void warning(const std::string& message) {
        std::lock_guard<std::mutex> lock(log_mutex);
        std::cout << YELLOW << "[RINDEX] " << get_timestamp() << " - WARNING: " << message << RESET << std::endl;
    }

    void error(const std::string& message) {
        std::lock_guard<std::mutex> lock(log_mutex);
        std::cerr << RED << "[RINDEX] " << get_timestamp() << " - ERROR: " << message << RESET << std::endl;
    }

    void set_quiet(bool enabled) {
        quiet = enabled;
    }

    void set_progress_enabled(bool enabled) {
        show_progress = enabled;
    }

    std::chrono::steady_clock::time_point progress_start() {
        return std::chrono::steady_clock::now();
    }

    void progress(size_t count, const std::string& prefix) {
        if (!show_progress) return;
        std::lock_guard<std::mutex> lock(log_mutex);
        std::cerr << "\r[RINDEX] " << prefix << ": " << count << std::flush;
    }

    void progress_done(size_t count, const std::string& message,
                       std::chrono::steady_clock::time_point begin) {
        if (!show_progress) return;
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - begin).count();
        std::lock_guard<std::mutex> lock(log_mutex);
        std::cerr << "\r[RINDEX] " << message << ": " << count
                  << " (" << std::fixed << std::setprecision(2)
                  << static_cast<double>(elapsed) / 1000.0 << "s)" << std::endl;
    }
}
