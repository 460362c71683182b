/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef RINDEX_SUBCALL_COMPUTE_HPP
#define RINDEX_SUBCALL_COMPUTE_HPP

#include "subcall/subcall.hpp"

namespace subcall {

/**
 * Compute subcommand (default): rearrangement index per ALG and per genome
 * for every coordinates file, written as four TSV tables.
 */
class compute : public subcall {
public:
    cxxopts::Options parse_args(int argc, char** argv) override;
    void validate(const cxxopts::ParseResult& args) override;
    void execute(const cxxopts::ParseResult& args) override;

    std::string name() const override { return "compute"; }
    std::string description() const override {
        return "Compute rearrangement indices for a directory of coordinates files";
    }
};

} // namespace subcall

#endif // RINDEX_SUBCALL_COMPUTE_HPP
