#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <string>
#include <vector>

#include "Alphabet.hpp"
#include "DataStructs.hpp"
#include "Expander.hpp"
#include "Types.hpp"

namespace PolyCore {

/**
 * @brief Configuration for distance matrix calculation.
 */
struct DistanceConfig {
    SiteSet site_set = SiteSet::CORE_ALL;                              ///< Columns compared
    CopyAggregation aggregation = CopyAggregation::BEST_MATCH;         ///< Per-site copy reduction
    NanDistanceStrategy nan_strategy = NanDistanceStrategy::MAX_DIST;  ///< Strategy for invalid pairs
    double max_distance_value = 1.0;  ///< Value for MAX_DIST strategy
    int min_common_sites = 1;         ///< Minimum sites where both samples are called
    double min_gf = 0.9;              ///< Per-site call threshold, same as classification
    int num_threads = 1;              ///< Number of threads for parallel computation
};

/**
 * @brief Symmetric pairwise distances between samples over classified core sites.
 *
 * distance(i, j) = sum of per-site dissimilarity / sites where both samples are called.
 * The diagonal is zero. Pairs with fewer than min_common_sites compared sites take the
 * value of the NaN strategy.
 */
class DistanceMatrix {
public:
    std::vector<std::string> sample_ids;  ///< Row/column labels
    Eigen::MatrixXd dist_matrix;          ///< Symmetric NxN distance matrix
    Eigen::MatrixXd diff_sums;            ///< Summed per-site dissimilarity
    Eigen::MatrixXi compared;             ///< Sites where both samples are called
    int min_common_sites = 1;
    SiteSet site_set = SiteSet::CORE_ALL;
    CopyAggregation aggregation = CopyAggregation::BEST_MATCH;
    NanDistanceStrategy nan_strategy = NanDistanceStrategy::MAX_DIST;

    size_t num_sites = 0;    ///< Columns compared
    size_t chunk_width = 0;
    size_t num_chunks = 0;

    // Statistics
    int num_valid_pairs = 0;         ///< Number of valid (computed) pairs
    int num_invalid_pairs = 0;       ///< Number of pairs with too few compared sites
    double avg_common_sites = 0.0;   ///< Average compared sites per valid pair

    DistanceMatrix() = default;

    bool empty() const { return sample_ids.empty(); }

    int size() const { return static_cast<int>(sample_ids.size()); }

    double get_distance(int i, int j) const {
        if (i < 0 || i >= size() || j < 0 || j >= size()) return NAN;
        return dist_matrix(i, j);
    }

    /// Index of a sample id, -1 if absent.
    int index_of(const std::string& sample_id) const;

    /// Distance between two samples by id; NaN if either is absent.
    double get_distance(const std::string& sample_i, const std::string& sample_j) const {
        return get_distance(index_of(sample_i), index_of(sample_j));
    }

    /// Upper-triangle triplets (i < j) in row order.
    std::vector<DistanceCell> to_long_form() const;

    /**
     * @brief Write summary statistics to a text file.
     * @throws std::runtime_error if the file cannot be opened.
     */
    void write_stats(const std::string& filepath) const;
};

/**
 * @brief Computes the distance matrix of an expanded alignment in column chunks.
 *
 * Each chunk packs the per-base copy counts of every (column, sample) into one
 * uint32 cell, plus a scratch buffer of called-copy totals, and adds its columns to
 * the global accumulators in ascending column order. Chunks never split a column, so
 * the result is bit-identical for every chunk width. Rows of a chunk are processed in
 * parallel; each thread owns the upper-triangle cells of its rows.
 */
class DistanceCalculator {
public:
    explicit DistanceCalculator(const DistanceConfig& config) : config_(config) {}

    /**
     * @param alignment Per-sample symbols at the compared columns.
     * @param chunk_width Columns per chunk; 0 processes everything in one chunk.
     */
    DistanceMatrix compute(const ExpandedAlignment& alignment, size_t chunk_width) const;

    /**
     * @brief Dissimilarity of two called genotypes at one site, in [0, 1].
     *
     * BEST_MATCH: 1 - sum_a min(f_i[a], f_j[a]), the share of copies left unmatched by
     * the best copy assignment. MEAN_PAIR: 1 - sum_a f_i[a] * f_j[a], the chance that two
     * randomly drawn copies differ. Evaluated on integer counts so identical genotypes
     * give exactly 0 under BEST_MATCH.
     */
    static double site_dissimilarity(const AlleleCounts& counts_i, const AlleleCounts& counts_j,
                                     CopyAggregation aggregation);

    /// Packs per-base copy counts (each at most 255) into one cell.
    static uint32_t pack_counts(const AlleleCounts& counts);
    static AlleleCounts unpack_counts(uint32_t cell);

    const DistanceConfig& config() const { return config_; }

    static std::string aggregation_to_string(CopyAggregation aggregation);
    static CopyAggregation string_to_aggregation(const std::string& str);
    static std::string site_set_to_string(SiteSet set);
    static SiteSet string_to_site_set(const std::string& str);
    static std::string nan_strategy_to_string(NanDistanceStrategy strategy);
    static NanDistanceStrategy string_to_nan_strategy(const std::string& str);

private:
    DistanceConfig config_;

    void fill_chunk(const ExpandedAlignment& alignment, size_t start, size_t width, std::vector<uint32_t>& cells,
                    std::vector<uint32_t>& called) const;
};

}  // namespace PolyCore
