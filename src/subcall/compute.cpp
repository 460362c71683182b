/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/compute.hpp"

#include <stdexcept>

#include "builder.hpp"
#include "result_tables.hpp"
#include "utility.hpp"

namespace subcall {

cxxopts::Options compute::parse_args(int argc, char** argv) {
    cxxopts::Options options("rindex compute",
        "Compute rearrangement indices for a directory of coordinates files");

    options.add_options("Output")
        ("p,precision", "Significant digits of values in output tables",
            cxxopts::value<int>()->default_value("10"))
        ("missing", "Marker for missing values (ALG absent from a genome)",
            cxxopts::value<std::string>()->default_value("NA"))
        ;

    add_common_options(options);

    return options;
}

void compute::validate(const cxxopts::ParseResult& args) {
    validate_input(args);

    int precision = args["precision"].as<int>();
    if (precision < 1 || precision > 17) {
        throw std::runtime_error("--precision must be between 1 and 17");
    }

    if (args["missing"].as<std::string>().empty()) {
        throw std::runtime_error("--missing must not be empty");
    }
}

void compute::execute(const cxxopts::ParseResult& args) {
    logging::info("If you use the rearrangement index in your work, please cite: "
                  "Lewin TD, Liao IJY, Luo YJ. Annelid comparative genomics and the "
                  "evolution of massive lineage-specific genome rearrangement in "
                  "bilaterians. BioRxiv (2024)");

    auto genomes = load_genomes(args);
    auto aliases = load_aliases(args);
    uint32_t threads = args["threads"].as<uint32_t>();

    auto tables = builder::build_from_manifest(genomes, aliases, threads);

    result_tables::write_options opts;
    opts.precision = args["precision"].as<int>();
    opts.missing = args["missing"].as<std::string>();

    auto out_dir = resolve_output_dir(args);
    tables.write_all(out_dir, opts);

    logging::info("Results written to: " + out_dir.string());
}

} // namespace subcall
