/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef RINDEX_CROSSTAB_HPP
#define RINDEX_CROSSTAB_HPP

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "file_entries.hpp"

/**
 * Chromosome x ALG gene counts of one genome.
 *
 * Stored per ALG (ALG -> chromosome -> count) so that each ALG's
 * chromosomes can be scanned directly; per-chromosome totals over all
 * ALGs are kept alongside. Only observed pairs are stored. Ordered maps
 * make iteration independent of the order genes were added.
 */
class crosstab {
public:
    using chromosome_counts = std::map<std::string, size_t>;

    crosstab() = default;
    explicit crosstab(const std::vector<gene_record>& genes);

    void add(const std::string& chromosome, const std::string& alg);

    // genes of alg on chromosome (0 if the pair was not observed)
    size_t count(const std::string& chromosome, const std::string& alg) const;

    // genes of alg over all chromosomes
    size_t alg_total(const std::string& alg) const;

    // genes on chromosome over all ALGs
    size_t chromosome_total(const std::string& chromosome) const;

    const std::map<std::string, chromosome_counts>& by_alg() const { return per_alg; }

    size_t total_genes() const { return genes; }
    size_t alg_count() const { return per_alg.size(); }
    size_t chromosome_count() const { return per_chromosome.size(); }
    bool empty() const { return genes == 0; }

    /**
     * Write counts as TSV: one row per chromosome, one column per ALG
     * (0 where the pair was not observed) and a trailing total column.
     * @throws std::runtime_error if the file cannot be created
     */
    void write_tsv(const std::filesystem::path& path) const;

private:
    std::map<std::string, chromosome_counts> per_alg;
    chromosome_counts per_alg_total;
    chromosome_counts per_chromosome;
    size_t genes = 0;
};

#endif //RINDEX_CROSSTAB_HPP
