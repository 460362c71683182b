/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef RINDEX_UTILITY_HPP
#define RINDEX_UTILITY_HPP

// standard
#include <chrono>
#include <cstddef>
#include <string>

namespace logging {
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // info messages are dropped when quiet; warnings and errors never are
    void set_quiet(bool enabled);

    // progress output (single line, overwritten in place)
    void set_progress_enabled(bool enabled);
    std::chrono::steady_clock::time_point progress_start();
    void progress(size_t count, const std::string& prefix);
    void progress_done(size_t count, const std::string& message,
                       std::chrono::steady_clock::time_point begin);
}

#endif //RINDEX_UTILITY_HPP
