/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef RINDEX_BUILDER_HPP
#define RINDEX_BUILDER_HPP

// standard
#include <cstdint>
#include <functional>

// class
#include "alg_map.hpp"
#include "genome_manifest.hpp"
#include "genome_table.hpp"
#include "result_tables.hpp"

/**
 * builder - runs the load -> index -> collect pipeline over a set of genomes
 *
 * Genomes are independent: each worker loads and indexes one genome at a
 * time and only takes the merge lock to add its result to the shared tables.
 * The first exception raised by any worker is rethrown once all workers
 * have stopped; remaining genomes are not started after a failure.
 */
class builder {
public:
    // called once per loaded genome (under no lock; must be thread-safe)
    using genome_visitor = std::function<void(const genome_table&)>;

    /**
     * Compute results for every genome in the manifest
     *
     * @param manifest Genomes to process
     * @param aliases ALG aliases applied while loading
     * @param threads Worker threads (0 = hardware concurrency)
     * @return tables holding one genome_result per species
     */
    static result_tables build_from_manifest(
        const genome_manifest& manifest,
        const alg_map& aliases,
        uint32_t threads
    );

    /**
     * Load every genome and hand it to visitor (no indexing)
     */
    static void visit_genomes(
        const genome_manifest& manifest,
        const alg_map& aliases,
        uint32_t threads,
        const genome_visitor& visitor
    );

    // resolve a requested thread count against the amount of work
    static uint32_t resolve_threads(uint32_t requested, size_t jobs);
};

#endif //RINDEX_BUILDER_HPP
