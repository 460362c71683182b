/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef RINDEX_RESULT_TABLES_HPP
#define RINDEX_RESULT_TABLES_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "rearrangement_indexer.hpp"

/**
 * Results of all genomes of a run, keyed by species.
 *
 * ALG tables have one row per ALG (union over all genomes) and one column
 * per species; a cell is missing when the species has no gene of that ALG.
 * Rows and columns are sorted, so output does not depend on the order in
 * which genomes were added.
 */
class result_tables {
public:
    enum class metric {
        REARRANGEMENT,  // RALG
        SPLITTING,      // SCHR
        COMBINING       // CCHR
    };

    struct write_options {
        int precision = 10;          // significant digits
        std::string missing = "NA";  // marker for missing cells
    };

    static constexpr const char* REARRANGEMENT_FILE = "Rearrangement_index.tsv";
    static constexpr const char* SPLITTING_FILE = "Splitting_parameter.tsv";
    static constexpr const char* COMBINING_FILE = "Combining_parameter.tsv";
    static constexpr const char* GENOME_FILE = "Genome_rearrangement_index.tsv";

    /**
     * Add one genome's results
     * @throws std::invalid_argument if the species is already present
     */
    void add(genome_result result);

    std::vector<std::string> species() const;
    std::vector<std::string> algs() const;

    std::optional<double> value(metric m, const std::string& alg, const std::string& species) const;
    std::optional<double> genome_index(const std::string& species) const;
    const genome_result* get(const std::string& species) const;

    size_t size() const { return genomes.size(); }
    bool empty() const { return genomes.empty(); }

    /**
     * Write one ALG x species table
     * @throws std::runtime_error if the file cannot be created
     */
    void write_alg_table_tsv(const std::filesystem::path& path, metric m,
                             const write_options& opts) const;

    /**
     * Write the per-genome table (species, genes, algs, Ri)
     * @throws std::runtime_error if the file cannot be created
     */
    void write_genome_tsv(const std::filesystem::path& path, const write_options& opts) const;

    /**
     * Write all four tables into output_dir under their standard file names
     * @return paths written, in the order listed above
     */
    std::vector<std::filesystem::path> write_all(const std::filesystem::path& output_dir,
                                                 const write_options& opts) const;

    static std::string format_value(const std::optional<double>& value, const write_options& opts);

private:
    std::map<std::string, genome_result> genomes;
};

#endif //RINDEX_RESULT_TABLES_HPP
