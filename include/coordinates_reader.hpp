/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef RINDEX_COORDINATES_READER_HPP
#define RINDEX_COORDINATES_READER_HPP

// standard
#include <filesystem>
#include <string>
#include <vector>

// zlib
#include <zlib.h>

// class
#include "file_reader.hpp"
#include "file_entries.hpp"

/**
 * Reader for coordinates files (one gene per row, six tab-separated columns):
 *
 *   gene_id  status  chromosome  start  end  ALG
 *
 * Plain and gzip-compressed files are both read through zlib (gzread passes
 * uncompressed input through unchanged). Empty lines and lines starting with
 * '#' are skipped. Any other row with fewer than six fields or a blank
 * gene_id/chromosome/ALG throws malformed_input_error.
 */
class coordinates_reader : public file_reader<gene_record> {
public:
    static constexpr size_t MIN_FIELDS = 6;

    explicit coordinates_reader(const std::filesystem::path& filepath);
    ~coordinates_reader() override;

    coordinates_reader(const coordinates_reader&) = delete;
    coordinates_reader& operator=(const coordinates_reader&) = delete;

    // Read next entry, false at end of file
    bool read_next(gene_record& entry) override;

    // Check if more entries available
    bool has_next() const override { return !eof_reached; }

    // Get current line number (for error reporting)
    size_t get_current_line() const override { return line_num; }

    // split a line on tabs, keeping empty fields
    static std::vector<std::string> split_fields(const std::string& line);

private:
    std::filesystem::path filepath;
    gzFile file = nullptr;
    size_t line_num = 0;
    bool eof_reached = false;

    bool next_line(std::string& line);
    void parse_line(const std::string& line, gene_record& entry) const;
};

#endif //RINDEX_COORDINATES_READER_HPP
