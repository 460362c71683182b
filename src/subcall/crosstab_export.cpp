/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/crosstab_export.hpp"

#include "builder.hpp"
#include "crosstab.hpp"
#include "utility.hpp"

namespace subcall {

cxxopts::Options crosstab_export::parse_args(int argc, char** argv) {
    cxxopts::Options options("rindex crosstab",
        "Write chromosome x ALG gene counts for each genome");

    add_common_options(options);

    return options;
}

void crosstab_export::validate(const cxxopts::ParseResult& args) {
    validate_input(args);
}

void crosstab_export::execute(const cxxopts::ParseResult& args) {
    auto genomes = load_genomes(args);
    auto aliases = load_aliases(args);
    uint32_t threads = args["threads"].as<uint32_t>();
    auto out_dir = resolve_output_dir(args);

    // one output file per genome, nothing shared between workers
    builder::visit_genomes(genomes, aliases, threads, [&](const genome_table& genome) {
        crosstab counts(genome.genes);
        if (counts.empty()) {
            logging::warning("No genes in " + genome.source_file.string());
        }

        auto path = out_dir / (genome.species + ".crosstab.tsv");
        counts.write_tsv(path);
        logging::info(genome.species + ": " + std::to_string(counts.chromosome_count()) +
                      " chromosomes x " + std::to_string(counts.alg_count()) +
                      " ALGs written to " + path.string());
    });

    logging::info("Cross-tabulations written to: " + out_dir.string());
}

} // namespace subcall
