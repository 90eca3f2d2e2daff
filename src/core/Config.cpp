#include "core/Config.hpp"

#include <htslib/hts.h>

#include <iostream>

#include "core/Alphabet.hpp"
#include "core/DistanceMatrix.hpp"

namespace PolyCore {

namespace {

/// Opens a file with htslib and checks that it is FASTA (plain or compressed).
bool check_fasta(const std::string& path, const std::string& label) {
    if (path.empty()) {
        std::cerr << "Error: " << label << " FASTA path is required." << std::endl;
        return false;
    }

    htsFile* fp = hts_open(path.c_str(), "r");
    if (fp == NULL) {
        std::cerr << "Error: Cannot open " << label << " FASTA file: " << path << std::endl;
        return false;
    }

    const htsFormat* format = hts_get_format(fp);
    const bool is_fasta = format->format == fasta_format;
    hts_close(fp);

    if (!is_fasta) {
        std::cerr << "Error: " << label << " file is not FASTA: " << path << std::endl;
        return false;
    }
    return true;
}

bool check_fraction(const char* name, double value) {
    if (value < 0.0 || value > 1.0) {
        std::cerr << "Error: " << name << " must be between 0.0 and 1.0 (got " << value << ")." << std::endl;
        return false;
    }
    return true;
}

}  // namespace

bool Config::validate() const {
    bool valid = true;

    if (!check_fasta(reference_fasta_path, "Reference")) {
        valid = false;
    }

    if (sample_paths.empty()) {
        std::cerr << "Error: At least one sample FASTA is required." << std::endl;
        valid = false;
    }
    for (const auto& path : sample_paths) {
        if (!check_fasta(path, "Sample")) {
            valid = false;
        }
    }

    valid = check_fraction("min-gf", min_gf) && valid;
    valid = check_fraction("min-cf", min_cf) && valid;
    valid = check_fraction("min-pf", min_pf) && valid;

    if (min_pn < 0) {
        std::cerr << "Error: min-pn must be non-negative." << std::endl;
        valid = false;
    }

    if (ploidy && (*ploidy < 1 || *ploidy > Alphabet::kMaxPloidy)) {
        std::cerr << "Error: ploidy must be between 1 and " << Alphabet::kMaxPloidy << "." << std::endl;
        valid = false;
    }

    if (min_common_sites < 0) {
        std::cerr << "Error: min-common-sites must be non-negative." << std::endl;
        valid = false;
    }

    if (threads <= 0) {
        std::cerr << "Error: threads must be positive." << std::endl;
        valid = false;
    }

    return valid;
}

void Config::print() const {
    std::cout << "--- Configuration ---" << std::endl;
    std::cout << "Reference: " << reference_fasta_path << std::endl;
    std::cout << "Samples: " << sample_paths.size() << (phased_records ? " (phased records)" : "") << std::endl;
    std::cout << "Output Dir: " << output_dir << std::endl;
    std::cout << "Thresholds: min-gf=" << min_gf << ", min-cf=" << min_cf << ", min-pf=" << min_pf
              << ", min-pn=" << min_pn << std::endl;
    std::cout << "Ploidy: " << (ploidy ? std::to_string(*ploidy) : "auto") << std::endl;
    std::cout << "Reference votes: " << (include_reference ? "yes" : "no") << std::endl;
    std::cout << "Progressive: " << (progressive ? "yes" : "no");
    if (progressive) {
        std::cout << " (" << (sample_order == SampleOrder::INPUT ? "input order" : "ascending missingness") << ")";
    }
    std::cout << std::endl;
    std::cout << "Distance: " << DistanceCalculator::site_set_to_string(distance_sites) << ", "
              << DistanceCalculator::aggregation_to_string(copy_aggregation) << ", "
              << DistanceCalculator::nan_strategy_to_string(nan_distance_strategy) << std::endl;
    std::cout << "Chunk Size: " << (chunk_size > 0 ? std::to_string(chunk_size) : "auto") << std::endl;
    std::cout << "Threads: " << threads << std::endl;
    std::cout << "---------------------" << std::endl;
}

}  // namespace PolyCore
