#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "SiteTally.hpp"
#include "Types.hpp"

namespace PolyCore {

/**
 * @brief Configuration structure holding all runtime parameters.
 *
 * Stores input/output paths and the analysis thresholds.
 * Validated by both CLI11 (basic checks) and internal validate() method (ranges and file formats).
 */
struct Config {
    // Input/Output
    std::string reference_fasta_path;        ///< Reference FASTA (Required)
    std::vector<std::string> sample_paths;   ///< One FASTA per sample (Required)
    std::string output_dir = ".";            ///< Output directory for results
    bool phased_records = false;             ///< Each record of a sample file is one allele copy
    bool write_vcf = true;                   ///< Write core.vcf

    // Core thresholds
    double min_gf = 0.9;   ///< Minimum genome fraction per sample
    double min_cf = 0.95;  ///< Minimum fraction of called samples per site
    double min_pf = 0.0;   ///< Minimum alternate copy fraction for a variant
    int min_pn = 0;        ///< Minimum samples carrying the alternate for a variant

    bool include_reference = false;       ///< Reference votes as a haploid sample
    bool require_reference_base = false;  ///< Exclude sites where the reference is missing

    // Ploidy
    std::optional<int> ploidy;  ///< Override; detected per sample when unset

    // Progressive core
    bool progressive = false;                    ///< Compute the soft-core trajectory
    SampleOrder sample_order = SampleOrder::INPUT;  ///< Admission order of samples

    // Distance Matrix Configuration
    SiteSet distance_sites = SiteSet::CORE_ALL;                                ///< Sites compared
    CopyAggregation copy_aggregation = CopyAggregation::BEST_MATCH;            ///< Copy reduction per site
    NanDistanceStrategy nan_distance_strategy = NanDistanceStrategy::MAX_DIST;  ///< Strategy for pairs without sites
    double max_distance_value = 1.0;  ///< Value for MAX_DIST strategy
    int min_common_sites = 1;         ///< Minimum sites both samples are called at
    size_t chunk_size = 0;            ///< Sites per distance chunk; 0 = from memory budget
    size_t memory_budget_mb = 0;      ///< Budget for chunking; 0 = read MemAvailable

    int threads = 1;  ///< Number of threads for parallel processing

    // Logging
    LogLevel log_level = LogLevel::LOG_INFO;  ///< Logging verbosity level
    std::string log_file;                     ///< Optional log file

    /**
     * @brief Validates configuration logic and file formats.
     *
     * Checks ranges of every threshold and opens each input with htslib to make sure
     * it is a readable FASTA file. Reasons are printed to stderr.
     *
     * @return true if configuration is valid, false otherwise.
     */
    bool validate() const;

    /**
     * @brief Prints the current configuration to stdout.
     */
    void print() const;

    CoreThresholds thresholds() const {
        CoreThresholds t;
        t.min_gf = min_gf;
        t.min_cf = min_cf;
        t.min_pf = min_pf;
        t.min_pn = min_pn;
        return t;
    }

    bool is_debug() const {
        return log_level >= LogLevel::LOG_DEBUG;
    }
};

}  // namespace PolyCore
