/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/dispatch.hpp"

// standard
#include <iostream>

// class
#include "config.hpp"
#include "utility.hpp"
#include "subcall/compute.hpp"
#include "subcall/crosstab_export.hpp"

namespace subcall {

void show_version(std::ostream& _str) {
    _str << "rindex v" << rindex_VERSION_MAJOR;
    _str << "." << rindex_VERSION_MINOR << ".";
    _str << rindex_VERSION_PATCH << " - ";
    _str << "Rearrangement index of ancestral linkage groups ";
    _str << "in chromosome-level genomes";
    _str << std::endl;
}

void show_usage(std::ostream& _str) {
    _str << "Usage: rindex [subcommand] <input_dir> [options]\n\n";
    _str << "Subcommands:\n";
    _str << "  compute    Compute rearrangement indices (default)\n";
    _str << "  crosstab   Write chromosome x ALG gene counts for each genome\n\n";
    _str << "Run 'rindex <subcommand> --help' for subcommand options.\n";
}

std::unique_ptr<subcall> make_subcall(const std::string& name) {
    if (name == "compute") {
        return std::make_unique<compute>();
    }
    if (name == "crosstab") {
        return std::make_unique<crosstab_export>();
    }
    return nullptr;
}

int dispatch(int argc, char** argv) {
    if (argc < 2) {
        show_usage(std::cerr);
        return 1;
    }

    auto cmd = make_subcall(argv[1]);
    int sub_argc = argc;
    char** sub_argv = argv;
    if (cmd) {
        sub_argc = argc - 1;
        sub_argv = argv + 1;
    } else {
        cmd = make_subcall("compute");
    }

    try {
        cxxopts::Options options = cmd->parse_args(sub_argc, sub_argv);
        auto result = options.parse(sub_argc, sub_argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }
        if (result.count("version")) {
            show_version(std::cout);
            return 0;
        }

        cmd->run(result);

    } catch(const cxxopts::exceptions::exception& e) {
        logging::error(e.what());
        show_usage(std::cerr);
        return 1;
    } catch(const std::exception& e) {
        logging::error(e.what());
        return 1;
    }

    return 0;
}

} // namespace subcall
