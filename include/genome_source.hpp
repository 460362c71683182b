/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef RINDEX_GENOME_SOURCE_HPP
#define RINDEX_GENOME_SOURCE_HPP

#include <filesystem>
#include <string>
#include <utility>

/**
 * One input genome: the species label used in output tables
 * and the coordinates file it is read from.
 */
struct genome_source {
    std::string species;                // column label in output tables
    std::filesystem::path source_file;  // coordinates file (.tsv or .tsv.gz)

    genome_source() = default;

    genome_source(std::string species, std::filesystem::path file)
        : species(std::move(species)), source_file(std::move(file)) {}
};

#endif //RINDEX_GENOME_SOURCE_HPP
