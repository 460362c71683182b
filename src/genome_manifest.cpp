/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "genome_manifest.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <unordered_set>

#include "coordinates_reader.hpp"
#include "errors.hpp"

namespace {
std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}
} // anonymous namespace

bool genome_manifest::is_eligible(const std::filesystem::path& filepath) {
    std::string name = filepath.filename().string();
    return ends_with(name, ".tsv") || ends_with(name, ".tsv.gz");
}

genome_manifest genome_manifest::from_directory(const std::filesystem::path& input_dir) {
    std::error_code ec;
    if (!std::filesystem::exists(input_dir, ec)) {
        throw input_directory_error("Input directory does not exist: " + input_dir.string());
    }
    if (!std::filesystem::is_directory(input_dir, ec)) {
        throw input_directory_error("Input path is not a directory: " + input_dir.string());
    }

    genome_manifest manifest;
    for (const auto& entry : std::filesystem::directory_iterator(input_dir)) {
        if (!entry.is_regular_file() || !is_eligible(entry.path())) {
            continue;
        }
        manifest.sources_.emplace_back(entry.path().filename().string(), entry.path());
    }

    if (manifest.sources_.empty()) {
        throw input_directory_error("No coordinates files (*.tsv, *.tsv.gz) found in: " +
                                    input_dir.string());
    }

    manifest.finalize(input_dir.string());
    return manifest;
}

genome_manifest genome_manifest::from_file(const std::filesystem::path& manifest_path) {
    std::ifstream file(manifest_path);
    if (!file.is_open()) {
        throw input_directory_error("Cannot open manifest file: " + manifest_path.string());
    }

    // Get manifest directory for resolving relative paths
    std::filesystem::path manifest_dir = manifest_path.parent_path();
    if (manifest_dir.empty()) {
        manifest_dir = ".";
    }

    genome_manifest manifest;
    std::string line;
    size_t line_num = 0;
    bool header_checked = false;

    while (std::getline(file, line)) {
        line_num++;

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto fields = coordinates_reader::split_fields(line);

        // Optional header line
        if (!header_checked) {
            header_checked = true;
            if (fields.size() >= 2 && to_lower(fields[0]) == "species" &&
                to_lower(fields[1]) == "file") {
                continue;
            }
        }

        if (fields.size() < 2) {
            throw malformed_input_error(manifest_path, line_num,
                "manifest line must have species and file columns");
        }
        if (fields[0].empty() || fields[1].empty()) {
            throw malformed_input_error(manifest_path, line_num, "empty species or file");
        }
        // labels also name per-genome output files
        if (fields[0].find('/') != std::string::npos || fields[0] == "." || fields[0] == "..") {
            throw malformed_input_error(manifest_path, line_num,
                "species label '" + fields[0] + "' is not a valid file name");
        }

        std::filesystem::path file_path(fields[1]);
        if (file_path.is_relative()) {
            file_path = manifest_dir / file_path;
        }
        if (!std::filesystem::is_regular_file(file_path)) {
            throw input_directory_error("Coordinates file listed in manifest not found: " +
                                        file_path.string());
        }

        manifest.sources_.emplace_back(fields[0], file_path);
    }

    if (manifest.sources_.empty()) {
        throw input_directory_error("Manifest lists no genomes: " + manifest_path.string());
    }

    manifest.finalize(manifest_path.string());
    return manifest;
}

void genome_manifest::finalize(const std::string& origin) {
    std::sort(sources_.begin(), sources_.end(),
        [](const genome_source& a, const genome_source& b) { return a.species < b.species; });

    std::unordered_set<std::string> seen;
    for (const auto& source : sources_) {
        if (!seen.insert(source.species).second) {
            throw input_directory_error("Species '" + source.species +
                                        "' listed more than once in: " + origin);
        }
    }
}
