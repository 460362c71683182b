/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

// class
#include "utility.hpp"
#include "genome_table.hpp"
#include "coordinates_reader.hpp"

genome_table genome_loader::load(const genome_source& source, const alg_map& aliases,
                                 bool running_count) {
    genome_table table;
    table.species = source.species;
    table.source_file = source.source_file;

    coordinates_reader reader(source.source_file);
    gene_record entry;

    std::string progress_prefix = "Reading " + source.source_file.filename().string();
    auto begin = logging::progress_start();

    while (reader.read_next(entry)) {
        if (!aliases.empty()) {
            entry.alg = aliases.resolve(entry.alg);
        }
        table.genes.push_back(entry);

        if (running_count && table.genes.size() % 50000 == 0) {
            logging::progress(table.genes.size(), progress_prefix);
        }
    }

    logging::progress_done(table.genes.size(), "Read " + source.source_file.filename().string(),
                           begin);
    return table;
}
