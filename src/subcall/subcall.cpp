/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/subcall.hpp"

#include <filesystem>
#include <stdexcept>

#include "errors.hpp"
#include "utility.hpp"

namespace subcall {

void subcall::add_common_options(cxxopts::Options& options) {
    options.add_options("Input")
        ("input", "Directory of coordinates files (*.tsv, *.tsv.gz)",
            cxxopts::value<std::string>())
        ("m,manifest", "Manifest TSV (species, file) used instead of an input directory",
            cxxopts::value<std::string>())
        ("merge-subgroups", "Merge bilaterian ALG sub-parts (A1a/A1b, Ea/Eb, Qa-Qd)")
        ("alg-map", "TSV of ALG aliases (label, alias) applied while loading",
            cxxopts::value<std::string>())
        ;

    options.add_options("Common")
        ("o,output-dir", "Output directory for results (default: working directory)",
            cxxopts::value<std::string>())
        ("t,threads", "Number of threads (0 = auto-detect)",
            cxxopts::value<uint32_t>()->default_value("1"))
        ("progress", "Show progress output")
        ("q,quiet", "Only print warnings and errors")
        ("h,help", "Show help message")
        ("v,version", "Show version")
        ;

    options.parse_positional({"input"});
    options.positional_help("<input_dir>");
}

void subcall::apply_common_options(const cxxopts::ParseResult& args) {
    if (args.count("progress")) {
        logging::set_progress_enabled(true);
    }
    if (args.count("quiet")) {
        logging::set_quiet(true);
    }
}

void subcall::validate_input(const cxxopts::ParseResult& args) {
    if (args.count("input") && args.count("manifest")) {
        throw input_directory_error("Give either an input directory or -m/--manifest, not both");
    }

    if (args.count("alg-map")) {
        std::string map_path = args["alg-map"].as<std::string>();
        if (!std::filesystem::exists(map_path)) {
            throw std::runtime_error("ALG alias file not found: " + map_path);
        }
    }

    if (args.count("manifest")) {
        std::string manifest_path = args["manifest"].as<std::string>();
        if (!std::filesystem::exists(manifest_path)) {
            throw input_directory_error("Manifest file not found: " + manifest_path);
        }
        return;
    }

    if (!args.count("input")) {
        throw input_directory_error("No input directory specified");
    }

    std::string input_dir = args["input"].as<std::string>();
    if (!std::filesystem::exists(input_dir)) {
        throw input_directory_error("Input directory does not exist: " + input_dir);
    }
    if (!std::filesystem::is_directory(input_dir)) {
        throw input_directory_error("Input path is not a directory: " + input_dir);
    }
}

std::filesystem::path subcall::resolve_output_dir(const cxxopts::ParseResult& args) {
    std::filesystem::path dir;

    if (args.count("output-dir")) {
        dir = args["output-dir"].as<std::string>();
    }

    if (dir.empty()) {
        dir = std::filesystem::current_path();
    }

    std::filesystem::create_directories(dir);
    return dir;
}

genome_manifest subcall::load_genomes(const cxxopts::ParseResult& args) {
    if (args.count("manifest")) {
        std::string manifest_path = args["manifest"].as<std::string>();
        logging::info("Loading manifest: " + manifest_path);
        auto manifest = genome_manifest::from_file(manifest_path);
        logging::info("Found " + std::to_string(manifest.size()) + " genome(s) in manifest");
        return manifest;
    }

    std::string input_dir = args["input"].as<std::string>();
    auto manifest = genome_manifest::from_directory(input_dir);
    logging::info("Found " + std::to_string(manifest.size()) + " coordinates file(s) in " +
                  input_dir);
    return manifest;
}

alg_map subcall::load_aliases(const cxxopts::ParseResult& args) {
    alg_map aliases;

    if (args.count("merge-subgroups")) {
        aliases.merge(alg_map::bilaterian_subgroups());
        logging::info("Merging bilaterian ALG sub-parts");
    }

    if (args.count("alg-map")) {
        std::string map_path = args["alg-map"].as<std::string>();
        auto from_file = alg_map::from_file(map_path);
        logging::info("Loaded " + std::to_string(from_file.size()) + " ALG alias(es) from: " +
                      map_path);
        aliases.merge(from_file);
    }

    return aliases;
}

void subcall::run(const cxxopts::ParseResult& args) {
    validate(args);
    apply_common_options(args);
    execute(args);
}

} // namespace subcall
