/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef RINDEX_ALG_MAP_HPP
#define RINDEX_ALG_MAP_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_map>

/**
 * Aliases applied to ALG labels as genes are loaded, e.g. to collapse
 * ALG sub-parts into their parent ALG.
 *
 * Alias file format (TSV, no header):
 * label    alias
 * A1a      A1
 * A1b      A1
 *
 * Lines starting with # and empty lines are skipped.
 */
class alg_map {
public:
    alg_map() = default;

    /**
     * Load aliases from a two-column TSV file
     * @throws std::runtime_error if the file cannot be read
     * @throws malformed_input_error on short rows or blank fields
     */
    static alg_map from_file(const std::filesystem::path& filepath);

    /**
     * Sub-parts of the bilaterian ALGs (Simakov et al. 2022):
     * A1a/A1b -> A1, Ea/Eb -> E, Qa/Qb/Qc/Qd -> Q
     */
    static alg_map bilaterian_subgroups();

    void add(const std::string& label, const std::string& alias);

    // the alias of label, or label itself if none is registered
    std::string resolve(const std::string& label) const;

    // merge other into this map (other wins on conflicts)
    void merge(const alg_map& other);

    size_t size() const { return aliases.size(); }
    bool empty() const { return aliases.empty(); }

private:
    std::unordered_map<std::string, std::string> aliases;
};

#endif //RINDEX_ALG_MAP_HPP
