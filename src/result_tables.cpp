/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "result_tables.hpp"

#include <fstream>
#include <iomanip>
#include <locale>
#include <set>
#include <sstream>
#include <stdexcept>

#include "utility.hpp"

void result_tables::add(genome_result result) {
    std::string species = result.species;
    if (!genomes.emplace(species, std::move(result)).second) {
        throw std::invalid_argument("Duplicate species in results: " + species);
    }
}

std::vector<std::string> result_tables::species() const {
    std::vector<std::string> labels;
    labels.reserve(genomes.size());
    for (const auto& [species, _] : genomes) {
        labels.push_back(species);
    }
    return labels;
}

std::vector<std::string> result_tables::algs() const {
    std::set<std::string> labels;
    for (const auto& [_, genome] : genomes) {
        for (const auto& [alg, result] : genome.algs) {
            labels.insert(alg);
        }
    }
    return {labels.begin(), labels.end()};
}

const genome_result* result_tables::get(const std::string& species) const {
    auto it = genomes.find(species);
    return it == genomes.end() ? nullptr : &it->second;
}

std::optional<double> result_tables::value(metric m, const std::string& alg,
                                           const std::string& species) const {
    const auto* genome = get(species);
    if (!genome) return std::nullopt;

    auto it = genome->algs.find(alg);
    if (it == genome->algs.end()) return std::nullopt;

    switch (m) {
        case metric::REARRANGEMENT:
            return it->second.rearrangement;
        case metric::SPLITTING:
            return it->second.splitting;
        case metric::COMBINING:
            return it->second.combining;
    }
    return std::nullopt;
}

std::optional<double> result_tables::genome_index(const std::string& species) const {
    const auto* genome = get(species);
    if (!genome) return std::nullopt;
    return genome->rearrangement_index;
}

std::string result_tables::format_value(const std::optional<double>& value,
                                        const write_options& opts) {
    if (!value) {
        return opts.missing;
    }
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::setprecision(opts.precision) << *value;
    return ss.str();
}

void result_tables::write_alg_table_tsv(const std::filesystem::path& path, metric m,
                                        const write_options& opts) const {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot create output file: " + path.string());
    }

    auto labels = species();

    out << "ALG";
    for (const auto& species : labels) {
        out << "\t" << species;
    }
    out << "\n";

    for (const auto& alg : algs()) {
        out << alg;
        for (const auto& species : labels) {
            out << "\t" << format_value(value(m, alg, species), opts);
        }
        out << "\n";
    }

    if (!out) {
        throw std::runtime_error("Failed writing output file: " + path.string());
    }
}

void result_tables::write_genome_tsv(const std::filesystem::path& path,
                                     const write_options& opts) const {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot create output file: " + path.string());
    }

    out << "species\tgenes\talgs\tRi\n";
    for (const auto& [species, genome] : genomes) {
        out << species
            << "\t" << genome.genes
            << "\t" << genome.algs.size()
            << "\t" << format_value(genome.rearrangement_index, opts)
            << "\n";
    }

    if (!out) {
        throw std::runtime_error("Failed writing output file: " + path.string());
    }
}

std::vector<std::filesystem::path> result_tables::write_all(
    const std::filesystem::path& output_dir, const write_options& opts) const {
    std::filesystem::create_directories(output_dir);

    std::vector<std::filesystem::path> written;

    auto rearrangement_path = output_dir / REARRANGEMENT_FILE;
    write_alg_table_tsv(rearrangement_path, metric::REARRANGEMENT, opts);
    logging::info("Rearrangement indices written to: " + rearrangement_path.string());
    written.push_back(rearrangement_path);

    auto splitting_path = output_dir / SPLITTING_FILE;
    write_alg_table_tsv(splitting_path, metric::SPLITTING, opts);
    logging::info("Splitting parameters written to: " + splitting_path.string());
    written.push_back(splitting_path);

    auto combining_path = output_dir / COMBINING_FILE;
    write_alg_table_tsv(combining_path, metric::COMBINING, opts);
    logging::info("Combining parameters written to: " + combining_path.string());
    written.push_back(combining_path);

    auto genome_path = output_dir / GENOME_FILE;
    write_genome_tsv(genome_path, opts);
    logging::info("Genome rearrangement indices written to: " + genome_path.string());
    written.push_back(genome_path);

    return written;
}
