#pragma once

#include <cstdint>
#include <string>

#include "Alphabet.hpp"
#include "DataStructs.hpp"

namespace PolyCore {

/// Tolerance for comparing a computed fraction against a threshold.
constexpr double kFractionEpsilon = 1e-9;

/**
 * @brief The four classification thresholds.
 */
struct CoreThresholds {
    double min_gf = 0.9;   ///< Minimum genome fraction per sample (whole genome and per site)
    double min_cf = 0.95;  ///< Minimum fraction of called samples per site
    double min_pf = 0.0;   ///< Minimum alternate-allele copy fraction for a variant
    int min_pn = 0;        ///< Minimum number of samples carrying the alternate

    /**
     * @throws ThresholdRangeError if a fraction is outside [0,1] or min_pn is negative.
     */
    void validate() const;
};

/**
 * @brief One sample's observation at one site.
 */
struct SampleSiteCall {
    AlleleCounts counts{0, 0, 0, 0};  ///< Observed copies per base
    int present = 0;                  ///< Observed copies
    bool called = false;              ///< Enough copies observed to vote
};

/**
 * @brief Running counts of one site over the samples admitted so far.
 */
struct SiteTally {
    int admitted_samples = 0;
    int called_samples = 0;
    int64_t present_copies = 0;   ///< Observed copies over all admitted samples
    int64_t expected_copies = 0;  ///< Ploidy summed over admitted samples
    AlleleCounts copies{0, 0, 0, 0};    ///< Called copies per base
    AlleleCounts carriers{0, 0, 0, 0};  ///< Called samples carrying each base

    int called_copies() const {
        return Alphabet::total(copies);
    }
};

/**
 * @brief Decodes the strands of one sample at one site.
 *
 * @param symbols Symbol of each strand at the site.
 * @param num_strands Number of strands.
 * @param ploidy Sample ploidy; each strand carries ploidy / num_strands copies when
 *        there is a single strand, otherwise one copy.
 * @param min_gf A sample is called when it has at least one observed copy and the
 *        observed fraction of its copies reaches min_gf.
 */
SampleSiteCall call_site(const char* symbols, int num_strands, int ploidy, double min_gf);

/**
 * @brief Admits one sample (or `weight` identical samples) into a site tally.
 *
 * Pure transition shared by the one-pass classifier and the progressive tracker.
 */
SiteTally admit(SiteTally tally, const SampleSiteCall& call, int ploidy, int weight = 1);

/**
 * @brief True when the called fraction of `voting_samples` reaches min_cf.
 */
bool passes_core(const SiteTally& tally, int voting_samples, double min_cf);

/**
 * @brief Derives statistics and the label of a site from its tally.
 *
 * Evaluated in order, first match wins:
 * 1. reference base missing and `require_reference_base` -> EXCLUDED
 * 2. core fraction < min_cf -> EXCLUDED
 * 3. an alternate exists, alt fraction >= min_pf and alt samples >= min_pn -> CORE_VARIANT
 * 4. fixed difference from the reference base and called samples >= min_pn -> CORE_VARIANT
 * 5. otherwise -> CORE_INVARIANT
 *
 * The major allele is the base with most called copies; ties go to the reference base,
 * then to the lowest rank. The alternate is the most frequent remaining base, ties to the
 * lowest rank. All remaining observed bases are kept in `alt_alleles`. A fixed difference
 * is a column where copies were called but none carries the reference base; every called
 * copy is then non-reference, so it passes any min_pf.
 */
SiteStat classify_site(size_t position, const SiteTally& tally, int voting_samples, char ref_symbol,
                       const CoreThresholds& thresholds, bool require_reference_base = false);

}  // namespace PolyCore
