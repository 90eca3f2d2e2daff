#pragma once

#include <cstddef>
#include <vector>

#include "AlignmentPanel.hpp"
#include "SequenceCollapser.hpp"
#include "SiteClassifier.hpp"

namespace PolyCore {

/**
 * @brief Soft-core trajectory: how the core shrinks as voting samples are admitted.
 *
 * Keeps one SiteTally per alignment column and updates it with the same admit()
 * transition the classifier uses. A site stays in the progressive core only while it
 * passed the core test at every prefix so far; once dropped it is never updated again,
 * so the core fraction is non-increasing in k and later steps only touch surviving sites.
 *
 * Points are produced lazily. Stopping early leaves the emitted points valid, and
 * reset() restarts from k = 0.
 */
class ProgressiveCoreTracker {
public:
    /**
     * @param panel Loaded panel.
     * @param collapsed Groups and profiles of the panel.
     * @param classification Classification of the full panel; supplies the voting rows
     *        and their genome fractions.
     * @param options Thresholds and reference handling, same as the classifier's.
     * @param order Admission order of the voting rows.
     */
    ProgressiveCoreTracker(const AlignmentPanel& panel, const CollapsedPanel& collapsed,
                           const Classification& classification, const ClassifierOptions& options,
                           SampleOrder order = SampleOrder::INPUT);

    bool has_next() const {
        return admitted_ < order_.size();
    }

    /**
     * @brief Admits the next row and returns the resulting point.
     * @throws std::out_of_range when every row has been admitted.
     */
    CoreTrajectoryPoint next();

    /// Drops every tally and restarts from an empty prefix.
    void reset();

    /// Resets, then admits every row.
    std::vector<CoreTrajectoryPoint> run();

    /// Rows in admission order.
    const std::vector<int>& order() const {
        return order_;
    }

    /// Sites still in the progressive core.
    size_t core_sites() const {
        return active_.size();
    }

private:
    const AlignmentPanel& panel_;
    const CollapsedPanel& collapsed_;
    ClassifierOptions options_;

    std::vector<int> order_;
    std::vector<SiteTally> tallies_;  ///< One per column
    std::vector<size_t> active_;      ///< Columns still in the core, ascending
    size_t admitted_ = 0;

    void build_order(const Classification& classification, SampleOrder order);
};

}  // namespace PolyCore
