#include "core/SequenceCollapser.hpp"

#include <functional>
#include <map>
#include <sstream>
#include <string_view>
#include <unordered_map>

#include "utils/Logger.hpp"

namespace PolyCore {

CollapsedPanel SequenceCollapser::collapse(const AlignmentPanel& panel) const {
    CollapsedPanel result;
    const int num_rows = panel.num_rows();
    result.strand_group.resize(num_rows);
    result.row_profile.assign(num_rows, -1);

    // hash -> groups whose representative has that hash
    std::unordered_map<size_t, std::vector<int>> buckets;
    buckets.reserve(panel.num_strands());
    std::hash<std::string_view> hasher;

    for (int row = 0; row < num_rows; ++row) {
        const Sample& sample = panel.row(row);
        result.strand_group[row].resize(sample.strands.size(), -1);

        for (int copy = 0; copy < sample.num_strands(); ++copy) {
            const std::string& seq = sample.strands[copy];
            const size_t key = hasher(std::string_view(seq));
            std::vector<int>& bucket = buckets[key];

            int group_id = -1;
            for (int candidate : bucket) {
                if (panel.strand(result.groups[candidate].representative) == seq) {
                    group_id = candidate;
                    break;
                }
            }

            if (group_id < 0) {
                SequenceGroup group;
                group.group_id = static_cast<int>(result.groups.size());
                group.representative = StrandId{row, copy};
                result.groups.push_back(std::move(group));
                group_id = result.groups.back().group_id;
                bucket.push_back(group_id);
            }

            result.groups[group_id].members.push_back(StrandId{row, copy});
            result.strand_group[row][copy] = group_id;
        }
    }

    // Profile key: ploidy followed by the ordered group ids
    std::map<std::vector<int>, int> profile_index;
    for (int row = 0; row < num_rows; ++row) {
        std::vector<int> key;
        key.reserve(result.strand_group[row].size() + 1);
        key.push_back(panel.row(row).ploidy);
        key.insert(key.end(), result.strand_group[row].begin(), result.strand_group[row].end());

        auto it = profile_index.find(key);
        if (it == profile_index.end()) {
            GenotypeProfile profile;
            profile.profile_id = static_cast<int>(result.profiles.size());
            profile.ploidy = panel.row(row).ploidy;
            profile.group_ids = result.strand_group[row];
            result.profiles.push_back(std::move(profile));
            it = profile_index.emplace(std::move(key), result.profiles.back().profile_id).first;
        }

        result.profiles[it->second].rows.push_back(row);
        result.row_profile[row] = it->second;
    }

    return result;
}

void SequenceCollapser::report(const AlignmentPanel& panel, const CollapsedPanel& collapsed) {
    for (const auto& profile : collapsed.profiles) {
        if (profile.rows.size() < 2) {
            continue;
        }
        std::ostringstream ss;
        ss << "Identical samples will be treated as one: [";
        for (size_t i = 0; i < profile.rows.size(); ++i) {
            ss << (i > 0 ? ", " : "") << panel.row(profile.rows[i]).id;
        }
        ss << "]";
        LOG_INFO(ss.str());
    }

    std::ostringstream ss;
    ss << "Collapsed " << panel.num_strands() << " strands into " << collapsed.num_groups() << " groups ("
       << collapsed.num_profiles() << " genotype profiles over " << panel.num_rows() << " rows)";
    LOG_INFO(ss.str());
}

}  // namespace PolyCore
