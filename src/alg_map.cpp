/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "alg_map.hpp"

#include <fstream>
#include <stdexcept>

#include "coordinates_reader.hpp"
#include "errors.hpp"

alg_map alg_map::from_file(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open ALG alias file: " + filepath.string());
    }

    alg_map map;
    std::string line;
    size_t line_num = 0;

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
        if (fields.size() < 2) {
            throw malformed_input_error(filepath, line_num,
                "alias line must have label and alias columns");
        }
        if (fields[0].empty() || fields[1].empty()) {
            throw malformed_input_error(filepath, line_num, "empty label or alias");
        }

        map.add(fields[0], fields[1]);
    }

    return map;
}

alg_map alg_map::bilaterian_subgroups() {
    alg_map map;
    map.add("A1a", "A1");
    map.add("A1b", "A1");
    map.add("Ea", "E");
    map.add("Eb", "E");
    map.add("Qa", "Q");
    map.add("Qb", "Q");
    map.add("Qc", "Q");
    map.add("Qd", "Q");
    return map;
}

void alg_map::add(const std::string& label, const std::string& alias) {
    aliases[label] = alias;
}

std::string alg_map::resolve(const std::string& label) const {
    auto it = aliases.find(label);
    if (it == aliases.end()) {
        return label;
    }
    return it->second;
}

void alg_map::merge(const alg_map& other) {
    for (const auto& [label, alias] : other.aliases) {
        aliases[label] = alias;
    }
}
