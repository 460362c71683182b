/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef RINDEX_ERRORS_HPP
#define RINDEX_ERRORS_HPP

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>

/**
 * Input directory (or manifest) cannot be used: missing, not a directory,
 * or no eligible coordinates files. Raised before any genome is processed.
 */
class input_directory_error : public std::runtime_error {
public:
    explicit input_directory_error(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * A row of a coordinates (or alias) file is short or has a blank required field.
 * Carries the file and 1-based line number of the offending row.
 */
class malformed_input_error : public std::runtime_error {
public:
    malformed_input_error(const std::filesystem::path& file, size_t line,
                          const std::string& reason)
        : std::runtime_error(file.string() + ":" + std::to_string(line) + ": " + reason),
          file_(file), line_(line) {}

    const std::filesystem::path& file() const { return file_; }
    size_t line() const { return line_; }

private:
    std::filesystem::path file_;
    size_t line_;
};

#endif //RINDEX_ERRORS_HPP
