/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "crosstab.hpp"

#include <fstream>
#include <stdexcept>

crosstab::crosstab(const std::vector<gene_record>& genes) {
    for (const auto& gene : genes) {
        add(gene.chromosome, gene.alg);
    }
}

void crosstab::add(const std::string& chromosome, const std::string& alg) {
    per_alg[alg][chromosome]++;
    per_alg_total[alg]++;
    per_chromosome[chromosome]++;
    genes++;
}

size_t crosstab::count(const std::string& chromosome, const std::string& alg) const {
    auto alg_it = per_alg.find(alg);
    if (alg_it == per_alg.end()) return 0;
    auto chr_it = alg_it->second.find(chromosome);
    return chr_it == alg_it->second.end() ? 0 : chr_it->second;
}

size_t crosstab::alg_total(const std::string& alg) const {
    auto it = per_alg_total.find(alg);
    return it == per_alg_total.end() ? 0 : it->second;
}

size_t crosstab::chromosome_total(const std::string& chromosome) const {
    auto it = per_chromosome.find(chromosome);
    return it == per_chromosome.end() ? 0 : it->second;
}

void crosstab::write_tsv(const std::filesystem::path& path) const {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot create output file: " + path.string());
    }

    out << "chromosome";
    for (const auto& [alg, _] : per_alg) {
        out << "\t" << alg;
    }
    out << "\ttotal\n";

    for (const auto& [chromosome, total] : per_chromosome) {
        out << chromosome;
        for (const auto& [alg, _] : per_alg) {
            out << "\t" << count(chromosome, alg);
        }
        out << "\t" << total << "\n";
    }

    if (!out) {
        throw std::runtime_error("Failed writing output file: " + path.string());
    }
}
