#include "core/DistanceMatrix.hpp"

#include <omp.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <stdexcept>

#include "core/SiteTally.hpp"
#include "utils/Logger.hpp"

namespace PolyCore {

// ============================================================================
// DistanceMatrix Methods
// ============================================================================

int DistanceMatrix::index_of(const std::string& sample_id) const {
    auto it = std::find(sample_ids.begin(), sample_ids.end(), sample_id);
    return it == sample_ids.end() ? -1 : static_cast<int>(it - sample_ids.begin());
}

std::vector<DistanceCell> DistanceMatrix::to_long_form() const {
    std::vector<DistanceCell> cells;
    const int n = size();
    cells.reserve(static_cast<size_t>(n) * (n > 0 ? n - 1 : 0) / 2);
    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            cells.push_back(DistanceCell{sample_ids[i], sample_ids[j], dist_matrix(i, j)});
        }
    }
    return cells;
}

void DistanceMatrix::write_stats(const std::string& filepath) const {
    std::ofstream ofs(filepath);
    if (!ofs.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + filepath);
    }

    ofs << "Distance Matrix Statistics\n";
    ofs << "==========================\n\n";
    ofs << "Number of samples: " << size() << "\n";
    ofs << "Site set: " << DistanceCalculator::site_set_to_string(site_set) << "\n";
    ofs << "Sites compared: " << num_sites << "\n";
    ofs << "Copy aggregation: " << DistanceCalculator::aggregation_to_string(aggregation) << "\n";
    ofs << "Min common sites: " << min_common_sites << "\n";
    ofs << "NaN strategy: " << DistanceCalculator::nan_strategy_to_string(nan_strategy) << "\n";
    ofs << "Chunk width: " << chunk_width << " (" << num_chunks << " chunks)\n";
    ofs << "\n";
    ofs << "Valid pairs: " << num_valid_pairs << "\n";
    ofs << "Invalid pairs (too few common sites): " << num_invalid_pairs << "\n";

    int total_pairs = (size() * (size() - 1)) / 2;
    if (total_pairs > 0) {
        double valid_ratio = 100.0 * num_valid_pairs / total_pairs;
        ofs << "Valid pair ratio: " << std::fixed << std::setprecision(1) << valid_ratio << "%\n";
    }

    ofs << "Average common sites: " << std::fixed << std::setprecision(2) << avg_common_sites << "\n";

    if (num_valid_pairs > 0) {
        std::vector<double> valid_distances;
        const int n = size();
        for (int i = 0; i < n; ++i) {
            for (int j = i + 1; j < n; ++j) {
                if (compared(i, j) >= min_common_sites && compared(i, j) > 0) {
                    valid_distances.push_back(dist_matrix(i, j));
                }
            }
        }

        if (!valid_distances.empty()) {
            std::sort(valid_distances.begin(), valid_distances.end());

            double sum = std::accumulate(valid_distances.begin(), valid_distances.end(), 0.0);
            double mean = sum / valid_distances.size();

            double sq_sum = 0.0;
            for (double d : valid_distances) {
                sq_sum += (d - mean) * (d - mean);
            }
            double std_dev = std::sqrt(sq_sum / valid_distances.size());

            ofs << "\nDistance Statistics:\n";
            ofs << "  Min: " << std::fixed << std::setprecision(4) << valid_distances.front() << "\n";
            ofs << "  Max: " << std::fixed << std::setprecision(4) << valid_distances.back() << "\n";
            ofs << "  Mean: " << std::fixed << std::setprecision(4) << mean << "\n";
            ofs << "  Std Dev: " << std::fixed << std::setprecision(4) << std_dev << "\n";

            size_t n_dist = valid_distances.size();
            ofs << "  25th percentile: " << valid_distances[n_dist / 4] << "\n";
            ofs << "  Median: " << valid_distances[n_dist / 2] << "\n";
            ofs << "  75th percentile: " << valid_distances[3 * n_dist / 4] << "\n";
        }
    }
}

// ============================================================================
// DistanceCalculator Methods
// ============================================================================

uint32_t DistanceCalculator::pack_counts(const AlleleCounts& counts) {
    uint32_t cell = 0;
    for (int b = 0; b < Alphabet::kNumBases; ++b) {
        cell |= (static_cast<uint32_t>(counts[b]) & 0xFFu) << (8 * b);
    }
    return cell;
}

AlleleCounts DistanceCalculator::unpack_counts(uint32_t cell) {
    AlleleCounts counts{0, 0, 0, 0};
    for (int b = 0; b < Alphabet::kNumBases; ++b) {
        counts[b] = static_cast<int>((cell >> (8 * b)) & 0xFFu);
    }
    return counts;
}

double DistanceCalculator::site_dissimilarity(const AlleleCounts& counts_i, const AlleleCounts& counts_j,
                                              CopyAggregation aggregation) {
    const int64_t total_i = Alphabet::total(counts_i);
    const int64_t total_j = Alphabet::total(counts_j);
    const int64_t denominator = total_i * total_j;
    if (denominator == 0) {
        return 0.0;
    }

    // Shared mass scaled by total_i * total_j
    int64_t shared = 0;
    for (int b = 0; b < Alphabet::kNumBases; ++b) {
        if (aggregation == CopyAggregation::BEST_MATCH) {
            shared += std::min<int64_t>(counts_i[b] * total_j, counts_j[b] * total_i);
        } else {
            shared += static_cast<int64_t>(counts_i[b]) * counts_j[b];
        }
    }
    return static_cast<double>(denominator - shared) / static_cast<double>(denominator);
}

void DistanceCalculator::fill_chunk(const ExpandedAlignment& alignment, size_t start, size_t width,
                                    std::vector<uint32_t>& cells, std::vector<uint32_t>& called) const {
    const int n = alignment.num_samples();

#pragma omp parallel for schedule(static) num_threads(config_.num_threads)
    for (int s = 0; s < n; ++s) {
        const ExpandedSample& sample = alignment.samples[s];
        const int num_strands = sample.num_strands();
        std::array<char, Alphabet::kMaxPloidy + 1> symbols;

        for (size_t w = 0; w < width; ++w) {
            for (int copy = 0; copy < num_strands; ++copy) {
                symbols[copy] = sample.strands[copy][start + w];
            }
            const SampleSiteCall call = call_site(symbols.data(), num_strands, sample.ploidy, config_.min_gf);
            const size_t offset = static_cast<size_t>(s) * width + w;
            cells[offset] = call.called ? pack_counts(call.counts) : 0;
            called[offset] = call.called ? static_cast<uint32_t>(call.present) : 0;
        }
    }
}

DistanceMatrix DistanceCalculator::compute(const ExpandedAlignment& alignment, size_t chunk_width) const {
    DistanceMatrix result;
    result.site_set = config_.site_set;
    result.aggregation = config_.aggregation;
    result.nan_strategy = config_.nan_strategy;
    result.min_common_sites = config_.min_common_sites;
    result.num_sites = alignment.num_sites();

    const int n = alignment.num_samples();
    result.sample_ids.reserve(n);
    for (const auto& sample : alignment.samples) {
        result.sample_ids.push_back(sample.id);
    }

    result.dist_matrix = Eigen::MatrixXd::Zero(n, n);
    result.diff_sums = Eigen::MatrixXd::Zero(n, n);
    result.compared = Eigen::MatrixXi::Zero(n, n);

    const size_t num_sites = alignment.num_sites();
    const size_t width = (chunk_width == 0 || chunk_width > num_sites) ? std::max<size_t>(num_sites, 1) : chunk_width;
    result.chunk_width = width;
    result.num_chunks = num_sites == 0 ? 0 : (num_sites + width - 1) / width;

    Utils::ScopedLogger scope("Calculating pairwise distances over " + std::to_string(num_sites) + " sites in " +
                              std::to_string(result.num_chunks) + " chunks");

    std::vector<uint32_t> cells(static_cast<size_t>(n) * width, 0);
    std::vector<uint32_t> called(static_cast<size_t>(n) * width, 0);

    for (size_t start = 0; start < num_sites; start += width) {
        const size_t chunk = std::min(width, num_sites - start);
        LOG_DEBUG("  Processing sites " + std::to_string(start) + "-" + std::to_string(start + chunk));
        fill_chunk(alignment, start, chunk, cells, called);

// Parallel computation of upper triangle
#pragma omp parallel for schedule(dynamic) num_threads(config_.num_threads)
        for (int i = 0; i < n; ++i) {
            const uint32_t* cells_i = cells.data() + static_cast<size_t>(i) * chunk;
            const uint32_t* called_i = called.data() + static_cast<size_t>(i) * chunk;

            for (int j = i + 1; j < n; ++j) {
                const uint32_t* cells_j = cells.data() + static_cast<size_t>(j) * chunk;
                const uint32_t* called_j = called.data() + static_cast<size_t>(j) * chunk;

                double diff = result.diff_sums(i, j);
                int common = result.compared(i, j);
                for (size_t w = 0; w < chunk; ++w) {
                    if (called_i[w] == 0 || called_j[w] == 0) {
                        continue;
                    }
                    common++;
                    // Identical cells differ only under MEAN_PAIR (heterozygous genotypes)
                    if (cells_i[w] != cells_j[w] || config_.aggregation == CopyAggregation::MEAN_PAIR) {
                        diff += site_dissimilarity(unpack_counts(cells_i[w]), unpack_counts(cells_j[w]),
                                                   config_.aggregation);
                    }
                }
                result.diff_sums(i, j) = diff;
                result.compared(i, j) = common;
            }
        }
    }

    // Determine NaN replacement value
    double nan_val = config_.max_distance_value;
    if (config_.nan_strategy == NanDistanceStrategy::SKIP) {
        nan_val = NAN;
    }

    long long total_common = 0;
    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            const int common = result.compared(i, j);
            result.diff_sums(j, i) = result.diff_sums(i, j);
            result.compared(j, i) = common;

            double dist = nan_val;
            if (common > 0 && common >= config_.min_common_sites) {
                dist = result.diff_sums(i, j) / static_cast<double>(common);
                result.num_valid_pairs++;
                total_common += common;
            } else {
                result.num_invalid_pairs++;
                LOG_WARNING("No comparable sites between " + result.sample_ids[i] + " and " + result.sample_ids[j] +
                            " (" + std::to_string(common) + " < " + std::to_string(config_.min_common_sites) + ")");
            }
            result.dist_matrix(i, j) = dist;
            result.dist_matrix(j, i) = dist;
        }
    }

    if (result.num_valid_pairs > 0) {
        result.avg_common_sites = static_cast<double>(total_common) / result.num_valid_pairs;
    }

    std::ostringstream ss;
    ss << "Distance matrices: " << result.num_valid_pairs + result.num_invalid_pairs << " pairwise comparisons ("
       << result.num_invalid_pairs << " without enough common sites)";
    LOG_INFO(ss.str());
    return result;
}

std::string DistanceCalculator::aggregation_to_string(CopyAggregation aggregation) {
    switch (aggregation) {
        case CopyAggregation::BEST_MATCH:
            return "BEST_MATCH";
        case CopyAggregation::MEAN_PAIR:
            return "MEAN_PAIR";
        default:
            return "UNKNOWN";
    }
}

CopyAggregation DistanceCalculator::string_to_aggregation(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    std::replace(upper.begin(), upper.end(), '-', '_');

    if (upper == "BEST_MATCH" || upper == "BEST") return CopyAggregation::BEST_MATCH;
    if (upper == "MEAN_PAIR" || upper == "MEAN") return CopyAggregation::MEAN_PAIR;
    throw std::invalid_argument("Unknown copy aggregation: " + str);
}

std::string DistanceCalculator::site_set_to_string(SiteSet set) {
    return set == SiteSet::CORE_ALL ? "CORE_ALL" : "CORE_VARIANT";
}

SiteSet DistanceCalculator::string_to_site_set(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    std::replace(upper.begin(), upper.end(), '-', '_');

    if (upper == "CORE_ALL" || upper == "ALL" || upper == "CORE") return SiteSet::CORE_ALL;
    if (upper == "CORE_VARIANT" || upper == "VARIANT") return SiteSet::CORE_VARIANT;
    throw std::invalid_argument("Unknown site set: " + str);
}

std::string DistanceCalculator::nan_strategy_to_string(NanDistanceStrategy strategy) {
    return strategy == NanDistanceStrategy::MAX_DIST ? "MAX_DIST" : "SKIP";
}

NanDistanceStrategy DistanceCalculator::string_to_nan_strategy(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    std::replace(upper.begin(), upper.end(), '-', '_');

    if (upper == "MAX_DIST" || upper == "MAX") return NanDistanceStrategy::MAX_DIST;
    if (upper == "SKIP" || upper == "NAN") return NanDistanceStrategy::SKIP;
    throw std::invalid_argument("Unknown NaN strategy: " + str);
}

}  // namespace PolyCore
