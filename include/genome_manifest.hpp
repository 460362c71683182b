/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef RINDEX_GENOME_MANIFEST_HPP
#define RINDEX_GENOME_MANIFEST_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "genome_source.hpp"

/**
 * Collects the genomes to process, either by scanning an input directory
 * or from a manifest file.
 *
 * Directory mode: every regular file ending in .tsv or .tsv.gz is a genome,
 * labelled with its file name.
 *
 * Manifest format (TSV, header optional):
 * species    file
 * Owenia     Owenia_coordinates.tsv
 * Capitella  /data/Capitella_coordinates.tsv.gz
 *
 * Relative paths are resolved against the manifest's directory.
 * Sources are returned sorted by species label.
 */
class genome_manifest {
public:
    /**
     * Scan a directory for coordinates files
     * @throws input_directory_error if the path is missing, not a directory
     *         or contains no eligible files
     */
    static genome_manifest from_directory(const std::filesystem::path& input_dir);

    /**
     * Parse a manifest file
     * @throws input_directory_error if the manifest is missing, lists a missing
     *         file, lists a species twice or lists nothing
     * @throws malformed_input_error on short rows, blank fields or a species
     *         label containing '/'
     */
    static genome_manifest from_file(const std::filesystem::path& manifest_path);

    // true if the file name marks a coordinates table
    static bool is_eligible(const std::filesystem::path& filepath);

    size_t size() const { return sources_.size(); }
    bool empty() const { return sources_.empty(); }
    const genome_source& operator[](size_t i) const { return sources_[i]; }

    auto begin() const { return sources_.begin(); }
    auto end() const { return sources_.end(); }

private:
    std::vector<genome_source> sources_;

    // sort by species and reject duplicate labels
    void finalize(const std::string& origin);
};

#endif //RINDEX_GENOME_MANIFEST_HPP
