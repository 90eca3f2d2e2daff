#pragma once

#include <string>
#include <vector>

#include "AlignmentPanel.hpp"
#include "SequenceCollapser.hpp"
#include "SiteClassifier.hpp"

namespace PolyCore {

/**
 * @brief Strands of one row restricted to a set of columns.
 */
struct ExpandedSample {
    int row = -1;
    std::string id;
    int ploidy = 1;
    std::vector<std::string> strands;  ///< One symbol per selected column

    int num_strands() const {
        return static_cast<int>(strands.size());
    }
    int dosage() const {
        return strands.size() == 1 ? ploidy : 1;
    }
};

/**
 * @brief Per-row symbols at the selected columns, in row order.
 */
struct ExpandedAlignment {
    std::vector<size_t> positions;  ///< Selected columns, ascending
    std::vector<ExpandedSample> samples;

    size_t num_sites() const {
        return positions.size();
    }
    int num_samples() const {
        return static_cast<int>(samples.size());
    }
};

/**
 * @brief Projects collapsed results back onto rows and copies.
 *
 * Symbols are always read from the group representative, which is byte-identical to
 * every member, so expansion reproduces the input exactly and never imputes.
 */
class Expander {
public:
    Expander(const AlignmentPanel& panel, const CollapsedPanel& collapsed) : panel_(panel), collapsed_(collapsed) {}

    /// Full sequence of a strand rebuilt from its group.
    const std::string& expand_strand(const StrandId& id) const;

    /**
     * @brief Per-row, per-copy symbols at the columns of a site set.
     *
     * @param classification Labels of every column.
     * @param site_set CORE_ALL or CORE_VARIANT.
     * @param rows Rows to expand, in output order.
     */
    ExpandedAlignment expand_sites(const Classification& classification, SiteSet site_set,
                                   const std::vector<int>& rows) const;

    /**
     * @brief Maps one value per genotype profile onto one value per row.
     */
    template <typename T>
    std::vector<T> project(const std::vector<T>& per_profile) const {
        std::vector<T> per_row;
        per_row.reserve(collapsed_.row_profile.size());
        for (int profile : collapsed_.row_profile) {
            per_row.push_back(per_profile.at(profile));
        }
        return per_row;
    }

    /**
     * @brief Builds one record per CORE_VARIANT column of an expanded alignment.
     *
     * REF is the reference base (the major allele where the reference is missing).
     * ALT lists every other base observed at the column in rank order. Genotypes hold
     * one allele index per copy, -1 for a missing copy; copies of a genotype-encoded
     * strand are unphased and listed in allele order.
     */
    static std::vector<VariantRecord> variant_records(const Classification& classification,
                                                      const ExpandedAlignment& alignment);

private:
    const AlignmentPanel& panel_;
    const CollapsedPanel& collapsed_;
};

}  // namespace PolyCore
