/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef RINDEX_FILE_ENTRIES_HPP
#define RINDEX_FILE_ENTRIES_HPP

#include <string>
#include <utility>

// represents a single row of a coordinates file
// (gene_id, status, chromosome, start, end, ALG)
struct gene_record {
    std::string gene_id;
    std::string chromosome;
    std::string alg;

    // carried through but not used by the index computation
    std::string status;
    std::string start;
    std::string end;

    gene_record() = default;
    gene_record(std::string gene_id, std::string chromosome, std::string alg)
        : gene_id{std::move(gene_id)}, chromosome{std::move(chromosome)},
        alg{std::move(alg)} {}
};

#endif //RINDEX_FILE_ENTRIES_HPP
