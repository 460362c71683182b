/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "coordinates_reader.hpp"

// standard
#include <cstring>
#include <stdexcept>

// class
#include "errors.hpp"

coordinates_reader::coordinates_reader(const std::filesystem::path& filepath)
    : filepath(filepath) {

    file = gzopen(filepath.string().c_str(), "rb");
    if (!file) {
        throw std::runtime_error("Failed to open coordinates file: " + filepath.string());
    }
}

coordinates_reader::~coordinates_reader() {
    if (file) {
        gzclose(file);
    }
}

bool coordinates_reader::read_next(gene_record& entry) {
    std::string line;

    while (next_line(line)) {
        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        parse_line(line, entry);
        return true;
    }

    eof_reached = true;
    return false;
}

bool coordinates_reader::next_line(std::string& line) {
    line.clear();
    if (eof_reached) return false;

    char buffer[4096];
    bool got_data = false;

    // gzgets stops at the buffer size; keep reading until the newline
    while (gzgets(file, buffer, sizeof(buffer)) != nullptr) {
        got_data = true;
        size_t len = std::strlen(buffer);
        if (len > 0 && buffer[len - 1] == '\n') {
            line.append(buffer, len - 1);
            break;
        }
        line.append(buffer, len);
    }

    if (!got_data) {
        int errnum = 0;
        const char* message = gzerror(file, &errnum);
        if (errnum != Z_OK && errnum != Z_STREAM_END) {
            throw std::runtime_error("Error reading " + filepath.string() + ": " + message);
        }
        return false;
    }

    line_num++;
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

void coordinates_reader::parse_line(const std::string& line, gene_record& entry) const {
    auto fields = split_fields(line);

    if (fields.size() < MIN_FIELDS) {
        throw malformed_input_error(filepath, line_num,
            "expected at least " + std::to_string(MIN_FIELDS) + " tab-separated fields, found " +
            std::to_string(fields.size()));
    }

    if (fields[0].empty()) {
        throw malformed_input_error(filepath, line_num, "empty gene ID");
    }
    if (fields[2].empty()) {
        throw malformed_input_error(filepath, line_num, "empty chromosome ID");
    }
    if (fields[5].empty()) {
        throw malformed_input_error(filepath, line_num, "empty ALG label");
    }

    entry.gene_id = std::move(fields[0]);
    entry.status = std::move(fields[1]);
    entry.chromosome = std::move(fields[2]);
    entry.start = std::move(fields[3]);
    entry.end = std::move(fields[4]);
    entry.alg = std::move(fields[5]);
}

std::vector<std::string> coordinates_reader::split_fields(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;

    while (true) {
        size_t tab = line.find('\t', start);
        std::string field = line.substr(start, tab == std::string::npos ? std::string::npos : tab - start);

        // Trim surrounding spaces
        size_t first = field.find_first_not_of(' ');
        size_t last = field.find_last_not_of(' ');
        fields.push_back(first == std::string::npos ? "" : field.substr(first, last - first + 1));

        if (tab == std::string::npos) break;
        start = tab + 1;
    }

    return fields;
}
