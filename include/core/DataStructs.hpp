#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "Types.hpp"

namespace PolyCore {

/**
 * @brief Identifies one allele-copy strand: panel row and copy index within that row.
 */
struct StrandId {
    int row = -1;   ///< Panel row (0 = reference)
    int copy = -1;  ///< Strand index within the row

    bool operator==(const StrandId& other) const {
        return row == other.row && copy == other.copy;
    }
    bool operator!=(const StrandId& other) const {
        return !(*this == other);
    }
    bool operator<(const StrandId& other) const {
        return row != other.row ? row < other.row : copy < other.copy;
    }
};

/**
 * @brief Outcome of ploidy resolution for one sample.
 */
struct PloidyCall {
    int ploidy = 1;                                ///< Ploidy used downstream
    PloidySource source = PloidySource::DETECTED;  ///< Where the value came from
    int detected = 1;                              ///< Value read from the data alone
    bool per_copy = false;                         ///< One strand per copy (phased records)
};

/**
 * @brief One genome of the panel: its allele-copy strands and ploidy.
 *
 * A sample is either per-copy (ploidy strands, one copy each) or genotype-encoded
 * (a single IUPAC strand carrying all copies).
 */
struct Sample {
    std::string id;                                       ///< Sample name
    int ploidy = 1;                                       ///< Number of genome copies
    PloidySource ploidy_source = PloidySource::DETECTED;  ///< Provenance of ploidy
    std::vector<std::string> strands;                     ///< Allele-copy sequences
    bool is_reference = false;                            ///< True for row 0

    int num_strands() const {
        return static_cast<int>(strands.size());
    }

    /// Copies carried by each strand.
    int dosage() const {
        return strands.size() == 1 ? ploidy : 1;
    }

    size_t length() const {
        return strands.empty() ? 0 : strands.front().size();
    }
};

/**
 * @brief Identical strands sharing one representative.
 */
struct SequenceGroup {
    int group_id = -1;
    StrandId representative;        ///< First strand encountered in input order
    std::vector<StrandId> members;  ///< All strands byte-identical to the representative

    size_t size() const {
        return members.size();
    }
};

/**
 * @brief Samples with identical ploidy and identical ordered strand groups.
 *
 * Every per-site quantity of a sample depends only on its profile, so per-site work is
 * done once per profile and weighted by the number of member rows.
 */
struct GenotypeProfile {
    int profile_id = -1;
    int ploidy = 1;
    std::vector<int> group_ids;  ///< Group of each strand, by copy index
    std::vector<int> rows;       ///< Member rows in input order
};

/**
 * @brief Statistics and label of one alignment column.
 */
struct SiteStat {
    size_t position = 0;           ///< 0-based column
    double genome_fraction = 0.0;  ///< Non-missing copies / expected copies of every sample row
    double core_fraction = 0.0;    ///< Called samples / voting samples
    double alt_fraction = 0.0;     ///< Copies of the alternate / called copies
    int alt_sample_count = 0;      ///< Called samples carrying the alternate
    int called_samples = 0;
    int called_copies = 0;
    char ref_symbol = 'N';         ///< Reference symbol at this column
    char major_allele = 'N';       ///< Most frequent called base ('N' if none)
    char alt_allele = 'N';         ///< Alternate used for frequency accounting ('N' if none)
    std::string alt_alleles;       ///< Every non-major observed base, in rank order
    bool fixed_difference = false; ///< Called copies present, none carries the reference base
    SiteClass label = SiteClass::EXCLUDED;

    bool is_core() const {
        return label != SiteClass::EXCLUDED;
    }
};

/**
 * @brief One point of the progressive (soft-core) trajectory.
 */
struct CoreTrajectoryPoint {
    int k = 0;                   ///< Number of samples admitted
    int row = -1;                ///< Row admitted at this step
    std::string sample_id;
    double core_fraction = 0.0;  ///< Core sites / alignment length
    size_t core_sites = 0;
    size_t variant_sites = 0;    ///< Core-variant sites at this prefix
};

struct DistanceCell {
    std::string sample_i;
    std::string sample_j;
    double distance = 0.0;
};

/**
 * @brief One multi-allelic variant record with per-copy genotype calls.
 */
struct VariantRecord {
    size_t position = 0;                      ///< 0-based column
    char ref = 'N';                           ///< REF base
    std::vector<char> alts;                   ///< ALT bases, rank order
    std::vector<std::vector<int>> genotypes;  ///< Allele index per copy per sample, -1 = missing
    std::vector<bool> phased;                 ///< Per sample: copies come from separate strands
};

/**
 * @brief Per-row outcome reported in the summary table.
 */
struct SampleSummary {
    std::string id;
    int ploidy = 1;
    PloidySource ploidy_source = PloidySource::DETECTED;
    size_t length = 0;
    size_t missing_copies = 0;    ///< Copy-positions without an observed base
    double genome_fraction = 0.0;
    double core_fraction = 0.0;   ///< Progressive value at admission, else final core fraction
    size_t called_core_sites = 0;
    size_t variant_sites = 0;     ///< Core-variant sites carrying a non-REF base
    bool voting = false;
    std::string warning;
};

}  // namespace PolyCore
