/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

// standard
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

// class
#include "utility.hpp"
#include "builder.hpp"
#include "rearrangement_indexer.hpp"

uint32_t builder::resolve_threads(uint32_t requested, size_t jobs) {
    uint32_t threads = requested;
    if (threads == 0) {
        threads = std::max(1u, std::thread::hardware_concurrency());
    }
    if (jobs < threads) {
        threads = static_cast<uint32_t>(std::max<size_t>(1, jobs));
    }
    return threads;
}

void builder::visit_genomes(const genome_manifest& manifest,
                            const alg_map& aliases,
                            uint32_t threads,
                            const genome_visitor& visitor) {
    const size_t jobs = manifest.size();
    threads = resolve_threads(threads, jobs);

    // in-place counters of concurrent workers would overwrite each other
    const bool running_count = threads == 1;

    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};
    std::exception_ptr first_error;
    std::mutex error_mutex;

    auto worker = [&]() {
        while (!failed) {
            size_t i = next.fetch_add(1);
            if (i >= jobs) break;

            const auto& source = manifest[i];
            try {
                logging::info("Processing file: " + source.source_file.string());
                genome_table genome = genome_loader::load(source, aliases, running_count);
                visitor(genome);
            } catch (...) {
                // keep the first failure, stop handing out new genomes
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
                failed = true;
            }
        }
    };

    if (threads == 1) {
        worker();
    } else {
        std::vector<std::thread> workers;
        workers.reserve(threads);
        for (uint32_t t = 0; t < threads; ++t) {
            workers.emplace_back(worker);
        }
        for (auto& w : workers) {
            w.join();
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

result_tables builder::build_from_manifest(const genome_manifest& manifest,
                                           const alg_map& aliases,
                                           uint32_t threads) {
    if (manifest.empty()) {
        logging::warning("No genomes provided");
        return {};
    }

    uint32_t workers = resolve_threads(threads, manifest.size());
    logging::info("Indexing " + std::to_string(manifest.size()) + " genome(s) using " +
                  std::to_string(workers) + " thread(s)");

    result_tables tables;
    std::mutex merge_mutex;

    visit_genomes(manifest, aliases, workers, [&](const genome_table& genome) {
        genome_result result = rearrangement_indexer::index(genome);

        logging::info(genome.species + ": " + std::to_string(result.genes) + " genes, " +
                      std::to_string(result.algs.size()) + " ALGs on " +
                      std::to_string(result.chromosomes) + " chromosomes");

        std::lock_guard<std::mutex> lock(merge_mutex);
        tables.add(std::move(result));
    });

    logging::info("Indexing complete: " + std::to_string(tables.size()) + " genome(s)");
    return tables;
}
