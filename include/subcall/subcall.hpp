/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef RINDEX_SUBCALL_HPP
#define RINDEX_SUBCALL_HPP

#include <filesystem>
#include <string>

#include <cxxopts.hpp>

#include "alg_map.hpp"
#include "genome_manifest.hpp"

namespace subcall {

/**
 * Abstract base class for all rindex subcommands.
 */
class subcall {
public:
    virtual ~subcall() = default;

    /**
     * Build the options object for this subcommand.
     * The subclass defines its own options here.
     * Should call add_common_options() to include shared options.
     */
    virtual cxxopts::Options parse_args(int argc, char** argv) = 0;

    /**
     * Validate parsed arguments. Throws on invalid input.
     */
    virtual void validate(const cxxopts::ParseResult& args) = 0;

    /**
     * Execute the subcommand.
     */
    virtual void execute(const cxxopts::ParseResult& args) = 0;

    /**
     * Template method: validate → apply_common_options → execute.
     */
    void run(const cxxopts::ParseResult& args);

    /**
     * Add options shared across all subcommands (input selection, ALG
     * aliasing, output directory, threads, verbosity).
     * Registers "input" as the positional argument.
     */
    static void add_common_options(cxxopts::Options& options);

    /**
     * Get the subcommand name (for help text).
     */
    virtual std::string name() const = 0;

    /**
     * Get brief description (for help text).
     */
    virtual std::string description() const = 0;

protected:
    /**
     * Check that exactly one input source was given and that it exists.
     * Throws input_directory_error otherwise.
     */
    static void validate_input(const cxxopts::ParseResult& args);

    /**
     * Resolve the output directory from --output-dir or the working directory.
     * Creates the directory if it doesn't exist.
     */
    static std::filesystem::path resolve_output_dir(const cxxopts::ParseResult& args);

    /**
     * Genomes from --manifest, or from scanning the positional input directory.
     */
    static genome_manifest load_genomes(const cxxopts::ParseResult& args);

    /**
     * ALG aliases from --merge-subgroups and --alg-map (file entries win).
     */
    static alg_map load_aliases(const cxxopts::ParseResult& args);

private:
    /**
     * Apply common options (progress, quiet)
     */
    static void apply_common_options(const cxxopts::ParseResult& args);
};

} // namespace subcall

#endif // RINDEX_SUBCALL_HPP
