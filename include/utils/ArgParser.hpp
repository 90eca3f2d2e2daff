#pragma once

#include <CLI/CLI.hpp>
#include <algorithm>
#include <iostream>
#include <map>

#include "core/Config.hpp"
#include "core/DistanceMatrix.hpp"

namespace PolyCore {
namespace Utils {

/// Version reported by --version.
constexpr const char* kVersion = "1.1";

/**
 * @brief Command-line argument parser wrapper around CLI11.
 */
class ArgParser {
public:
    /**
     * @brief Parses command line arguments and populates the Config object.
     *
     * Uses CLI11 to handle argument parsing, type conversion, and basic validation
     * (e.g., file existence, numeric ranges).
     *
     * @param argc Argument count.
     * @param argv Argument values.
     * @param config Reference to Config object to populate.
     * @return true if parsing was successful and execution should continue.
     * @return false if parsing failed or help/version was requested (execution should stop).
     */
    static bool parse(int argc, char** argv, Config& config) {
        CLI::App app{"PolyCore - Core genome analysis on polyploid organisms"};
        app.set_version_flag("--version", kVersion);

        // Input/Output
        app.add_option("--ref", config.reference_fasta_path, "Reference FASTA file (Required)")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("--sample", config.sample_paths, "Sample FASTA files (Required)")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("-o,--output-dir", config.output_dir, "Output directory (Default: .)");

        app.add_flag("--phased-records", config.phased_records,
            "Each record of a sample FASTA is one allele copy");

        app.add_flag("--vcf,!--no-vcf", config.write_vcf, "Write core.vcf (Default: enabled)");

        // Thresholds
        app.add_option("--min-gf", config.min_gf, "Minimum genome fraction per sample (Default: 0.9)")
            ->check(CLI::Range(0.0, 1.0));

        app.add_option("--min-cf", config.min_cf, "Minimum fraction with valid data per site (Default: 0.95)")
            ->check(CLI::Range(0.0, 1.0));

        app.add_option("--min-pf", config.min_pf, "Min fraction with alt per site (SNP vs SNV) (Default: 0)")
            ->check(CLI::Range(0.0, 1.0));

        app.add_option("--min-pn", config.min_pn, "Min # samples with alt per site (SNP vs SNV) (Default: 0)")
            ->check(CLI::NonNegativeNumber);

        app.add_flag("--include-reference", config.include_reference,
            "Let the reference vote as a haploid sample");

        app.add_flag("--require-reference-base", config.require_reference_base,
            "Exclude sites where the reference is missing");

        int ploidy = 0;
        auto* ploidy_opt = app.add_option("--ploidy", ploidy, "Ploidy of every sample (Default: auto)")
            ->check(CLI::Range(1, 255));

        // Progressive core
        app.add_flag("--progressive", config.progressive, "Compute the soft-core trajectory");

        std::string order_str = "input";
        app.add_option("--sample-order", order_str,
            "Admission order for --progressive: input, missingness (Default: input)")
            ->check(CLI::IsMember({"input", "missingness"}, CLI::ignore_case));

        // Distance Matrix Parameters
        std::string sites_str = "core_all";
        app.add_option("--distance-sites", sites_str,
            "Sites used for distances: core_all, core_variant (Default: core_all)")
            ->check(CLI::IsMember({"core_all", "core_variant"}, CLI::ignore_case));

        std::string aggregation_str = "best_match";
        app.add_option("--copy-aggregation", aggregation_str,
            "Per-site copy reduction: best_match, mean_pair (Default: best_match)")
            ->check(CLI::IsMember({"best_match", "mean_pair"}, CLI::ignore_case));

        std::string nan_strategy_str = "MAX_DIST";
        app.add_option("--nan-distance-strategy", nan_strategy_str,
            "Strategy for pairs without enough common sites: MAX_DIST, SKIP (Default: MAX_DIST)")
            ->check(CLI::IsMember({"MAX_DIST", "SKIP"}, CLI::ignore_case));

        app.add_option("--max-distance-value", config.max_distance_value,
            "Value for MAX_DIST strategy (Default: 1.0)")
            ->check(CLI::Range(0.0, 1000.0));

        app.add_option("--min-common-sites", config.min_common_sites,
            "Minimum sites both samples are called at (Default: 1)")
            ->check(CLI::NonNegativeNumber);

        app.add_option("--chunk-size", config.chunk_size, "Sites per chunk for pairwise diffs (controls memory)")
            ->check(CLI::PositiveNumber);

        app.add_option("--memory-budget-mb", config.memory_budget_mb,
            "Memory budget for chunking in MB (Default: 80% of MemAvailable)")
            ->check(CLI::PositiveNumber);

        app.add_option("-j,--threads", config.threads, "Number of threads (Default: 1)")
            ->check(CLI::PositiveNumber);

        // Logging
        std::string log_level_str = "info";
        app.add_option("--log-level", log_level_str,
            "Logging level: error, warn, info, debug (Default: info)")
            ->check(CLI::IsMember({"error", "warn", "info", "debug"}, CLI::ignore_case));

        app.add_option("--log-file", config.log_file, "Also write the log to this file");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // Help and version (ret=0) or a parse error (ret>0): print and stop.
            app.exit(e);
            return false;
        }

        if (ploidy_opt->count() > 0) {
            config.ploidy = ploidy;
        }

        static const std::map<std::string, LogLevel> log_level_map = {
            {"error", LogLevel::LOG_ERROR},
            {"warn", LogLevel::LOG_WARN},
            {"info", LogLevel::LOG_INFO},
            {"debug", LogLevel::LOG_DEBUG}
        };
        auto it = log_level_map.find(to_lower(log_level_str));
        if (it != log_level_map.end()) {
            config.log_level = it->second;
        }

        config.sample_order =
            to_lower(order_str) == "missingness" ? SampleOrder::ASCENDING_MISSINGNESS : SampleOrder::INPUT;
        config.distance_sites = DistanceCalculator::string_to_site_set(sites_str);
        config.copy_aggregation = DistanceCalculator::string_to_aggregation(aggregation_str);
        config.nan_distance_strategy = DistanceCalculator::string_to_nan_strategy(nan_strategy_str);

        return true;
    }

private:
    static std::string to_lower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(), ::tolower);
        return value;
    }
};

}  // namespace Utils
}  // namespace PolyCore
