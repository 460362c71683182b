/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef RINDEX_REARRANGEMENT_INDEXER_HPP
#define RINDEX_REARRANGEMENT_INDEXER_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include "crosstab.hpp"
#include "genome_table.hpp"

/**
 * Rearrangement statistics of one ALG in one genome.
 *
 * splitting     (SCHR) largest fraction of the ALG's genes on one chromosome
 * combining     (CCHR) fraction of that chromosome's genes belonging to the ALG
 * rearrangement (RALG) 1 - SCHR * CCHR
 */
struct alg_result {
    std::string alg;
    std::string home_chromosome;     // chromosome holding most of the ALG's genes
    size_t alg_genes = 0;            // genes of the ALG in the genome
    size_t home_genes = 0;           // genes of the ALG on the home chromosome
    size_t home_chromosome_genes = 0; // genes of all ALGs on the home chromosome

    double splitting = 0;
    double combining = 0;
    double rearrangement = 0;
};

// Per-ALG results plus the genome-level index
struct genome_result {
    std::string species;
    size_t genes = 0;
    size_t chromosomes = 0;
    std::map<std::string, alg_result> algs;

    // mean RALG over the ALGs present; no value for a genome without genes
    std::optional<double> rearrangement_index;
};

class rearrangement_indexer {
public:
    /**
     * Compute SCHR, CCHR and RALG for every ALG present in the cross-tabulation.
     * When several chromosomes hold the same (maximal) number of an ALG's genes,
     * the lexicographically smallest chromosome ID becomes the home chromosome.
     */
    static std::map<std::string, alg_result> index_algs(const crosstab& counts);

    // Ri: arithmetic mean of RALG; std::nullopt if there are no ALGs
    static std::optional<double> genome_index(const std::map<std::string, alg_result>& algs);

    // Cross-tabulate, index every ALG and average into Ri
    static genome_result index(const genome_table& genome);
};

#endif //RINDEX_REARRANGEMENT_INDEXER_HPP
