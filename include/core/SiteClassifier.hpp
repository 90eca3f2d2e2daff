#pragma once

#include <array>
#include <cstddef>
#include <vector>

#include "AlignmentPanel.hpp"
#include "SequenceCollapser.hpp"
#include "SiteTally.hpp"

namespace PolyCore {

/**
 * @brief Parameters of one classification pass.
 */
struct ClassifierOptions {
    CoreThresholds thresholds;
    bool include_reference = false;       ///< Let the reference vote like a haploid sample
    bool require_reference_base = false;  ///< Exclude columns where the reference is missing
    int num_threads = 1;
};

/**
 * @brief Per-profile counters over the retained sites.
 */
struct ProfileSiteCounts {
    size_t called_core_sites = 0;  ///< Core sites where the profile is called
    size_t variant_sites = 0;      ///< Core-variant sites where it carries a non-REF base
};

/**
 * @brief Result of one classification pass. Read-only once built.
 */
struct Classification {
    std::vector<SiteStat> sites;               ///< One entry per column
    std::vector<double> profile_genome_fraction;
    std::vector<size_t> profile_missing_copies;
    std::vector<bool> profile_passes_gf;
    std::vector<int> profile_voting_weight;    ///< Voting member rows per profile
    std::vector<int> profile_sample_weight;    ///< Sample rows per profile, voting or not
    std::vector<ProfileSiteCounts> profile_counts;
    std::vector<int> voting_rows;              ///< Rows that vote, in panel order
    int voting_samples = 0;

    size_t num_invariant = 0;
    size_t num_variant = 0;
    size_t num_excluded = 0;

    /// Columns selected by a site set, ascending.
    std::vector<size_t> positions(SiteSet set) const;

    /// Base composition (A,C,G,T) of REF over CORE_INVARIANT sites.
    std::array<size_t, 4> invariant_composition() const;
};

/**
 * @brief Labels every alignment column as core-invariant, core-variant or excluded.
 *
 * Works on genotype profiles from the collapsed panel, each weighted by its voting
 * member count, so identical samples are decoded once per column.
 */
class SiteClassifier {
public:
    explicit SiteClassifier(const ClassifierOptions& options) : options_(options) {}

    /**
     * @brief Runs the full classification.
     *
     * @throws ThresholdRangeError for invalid thresholds.
     * @throws EmptyAlignmentError when the alignment has no columns.
     */
    Classification classify(const AlignmentPanel& panel, const CollapsedPanel& collapsed) const;

    /**
     * @brief Decodes one profile at one column.
     */
    static SampleSiteCall call_profile(const AlignmentPanel& panel, const CollapsedPanel& collapsed,
                                       const GenotypeProfile& profile, size_t column, double min_gf);

    /**
     * @brief REF used for records and summaries: the reference base, or the major allele
     *        where the reference is missing or ambiguous.
     */
    static char effective_ref(const SiteStat& site);

    const ClassifierOptions& options() const {
        return options_;
    }

private:
    ClassifierOptions options_;

    void compute_genome_fractions(const AlignmentPanel& panel, const CollapsedPanel& collapsed,
                                  Classification& result) const;
    void count_profile_sites(const AlignmentPanel& panel, const CollapsedPanel& collapsed,
                             Classification& result) const;
};

}  // namespace PolyCore
