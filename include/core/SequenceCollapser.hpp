#pragma once

#include <string>
#include <vector>

#include "AlignmentPanel.hpp"
#include "DataStructs.hpp"

namespace PolyCore {

/**
 * @brief Partition of all panel strands into groups of identical sequences.
 *
 * Groups partition the strands: every (row, copy) belongs to exactly one group.
 * Profiles partition the rows the same way at sample level.
 */
struct CollapsedPanel {
    std::vector<SequenceGroup> groups;
    std::vector<std::vector<int>> strand_group;  ///< [row][copy] -> group id
    std::vector<GenotypeProfile> profiles;
    std::vector<int> row_profile;                ///< row -> profile id

    int group_of(const StrandId& id) const {
        return strand_group.at(id.row).at(id.copy);
    }
    const SequenceGroup& group(int group_id) const {
        return groups.at(group_id);
    }
    const GenotypeProfile& profile_of_row(int row) const {
        return profiles.at(row_profile.at(row));
    }
    size_t num_groups() const {
        return groups.size();
    }
    size_t num_profiles() const {
        return profiles.size();
    }
};

/**
 * @brief Collapses byte-identical strands into SequenceGroups.
 *
 * Strands are hashed and bucketed by hash; a strand joins a group only after a full
 * comparison with the group's representative, so hash collisions never merge distinct
 * sequences. Gaps and ambiguity codes are compared as-is. The representative of a group
 * is the first strand met in panel order (row, then copy), which makes the result
 * reproducible for a fixed input order.
 */
class SequenceCollapser {
public:
    SequenceCollapser() = default;

    /**
     * @brief Builds groups and genotype profiles for every strand of the panel.
     */
    CollapsedPanel collapse(const AlignmentPanel& panel) const;

    /**
     * @brief Logs the groups that merged more than one strand.
     */
    static void report(const AlignmentPanel& panel, const CollapsedPanel& collapsed);
};

}  // namespace PolyCore
