/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "rearrangement_indexer.hpp"

// class
#include "utility.hpp"

std::map<std::string, alg_result> rearrangement_indexer::index_algs(const crosstab& counts) {
    std::map<std::string, alg_result> results;

    for (const auto& [alg, chromosomes] : counts.by_alg()) {
        alg_result result;
        result.alg = alg;
        result.alg_genes = counts.alg_total(alg);

        // chromosomes are visited in sorted order; strict '>' keeps the first on ties
        for (const auto& [chromosome, genes] : chromosomes) {
            if (genes > result.home_genes) {
                result.home_genes = genes;
                result.home_chromosome = chromosome;
            }
        }

        // an ALG is only listed once it has a gene, so both totals are non-zero
        result.home_chromosome_genes = counts.chromosome_total(result.home_chromosome);

        result.splitting = static_cast<double>(result.home_genes) /
                           static_cast<double>(result.alg_genes);
        result.combining = static_cast<double>(result.home_genes) /
                           static_cast<double>(result.home_chromosome_genes);
        result.rearrangement = 1.0 - result.splitting * result.combining;

        results.emplace(alg, std::move(result));
    }

    return results;
}

std::optional<double> rearrangement_indexer::genome_index(
    const std::map<std::string, alg_result>& algs) {
    if (algs.empty()) {
        return std::nullopt;
    }

    double sum = 0;
    for (const auto& [alg, result] : algs) {
        sum += result.rearrangement;
    }
    return sum / static_cast<double>(algs.size());
}

genome_result rearrangement_indexer::index(const genome_table& genome) {
    crosstab counts(genome.genes);

    genome_result result;
    result.species = genome.species;
    result.genes = counts.total_genes();
    result.chromosomes = counts.chromosome_count();
    result.algs = index_algs(counts);
    result.rearrangement_index = genome_index(result.algs);

    if (!result.rearrangement_index) {
        logging::warning("No genes in " + genome.source_file.string() +
                         "; rearrangement index of " + genome.species + " reported as missing");
    }

    return result;
}
