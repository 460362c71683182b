/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef RINDEX_SUBCALL_CROSSTAB_EXPORT_HPP
#define RINDEX_SUBCALL_CROSSTAB_EXPORT_HPP

#include "subcall/subcall.hpp"

namespace subcall {

/**
 * Crosstab subcommand: chromosome x ALG gene counts per genome,
 * one <species>.crosstab.tsv per coordinates file.
 */
class crosstab_export : public subcall {
public:
    cxxopts::Options parse_args(int argc, char** argv) override;
    void validate(const cxxopts::ParseResult& args) override;
    void execute(const cxxopts::ParseResult& args) override;

    std::string name() const override { return "crosstab"; }
    std::string description() const override {
        return "Write chromosome x ALG gene counts for each genome";
    }
};

} // namespace subcall

#endif // RINDEX_SUBCALL_CROSSTAB_EXPORT_HPP
