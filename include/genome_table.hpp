/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef RINDEX_GENOME_TABLE_HPP
#define RINDEX_GENOME_TABLE_HPP

// standard
#include <filesystem>
#include <string>
#include <vector>

// class
#include "alg_map.hpp"
#include "file_entries.hpp"
#include "genome_source.hpp"

// All genes of one species, in file order
struct genome_table {
    std::string species;
    std::filesystem::path source_file;
    std::vector<gene_record> genes;

    size_t size() const { return genes.size(); }
    bool empty() const { return genes.empty(); }
};

/**
 * Loader for coordinates files
 *
 * Stateless; reads a whole file into a genome_table and applies the
 * ALG aliases to every label.
 */
class genome_loader {
public:
    /**
     * running_count prints an in-place gene count while reading; only one
     * loader may do so at a time, the closing summary line is always printed.
     * @throws malformed_input_error on the first bad row (whole file rejected)
     * @throws std::runtime_error if the file cannot be opened
     */
    static genome_table load(const genome_source& source, const alg_map& aliases = {},
                             bool running_count = true);
};

#endif //RINDEX_GENOME_TABLE_HPP
