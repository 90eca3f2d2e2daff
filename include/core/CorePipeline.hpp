#pragma once

#include <array>
#include <memory>
#include <string>
#include <vector>

#include "core/AlignmentPanel.hpp"
#include "core/ChunkPlanner.hpp"
#include "core/Config.hpp"
#include "core/DistanceMatrix.hpp"
#include "core/Expander.hpp"
#include "core/SequenceCollapser.hpp"
#include "core/SiteClassifier.hpp"
#include "utils/MemoryProbe.hpp"

namespace PolyCore {

/**
 * @brief Everything one run produces, before serialization.
 */
struct CoreResult {
    CollapsedPanel collapsed;
    Classification classification;
    std::vector<CoreTrajectoryPoint> trajectory;  ///< Empty unless progressive

    std::vector<int> output_rows;          ///< Reference, then the voting samples
    ExpandedAlignment core_alignment;      ///< CORE_ALL columns of the output rows
    ExpandedAlignment variant_alignment;   ///< CORE_VARIANT columns of the output rows
    std::vector<VariantRecord> variants;

    ChunkPlan chunk_plan;
    DistanceMatrix distances;

    std::vector<SampleSummary> summaries;  ///< One per panel row
    std::vector<std::string> warnings;

    std::array<size_t, 4> fconst{0, 0, 0, 0};  ///< Constant-site A,C,G,T counts
    double final_core_fraction = 0.0;          ///< Core sites / alignment length
};

/**
 * @brief Runs collapsing, classification, the progressive core, expansion and distances.
 *
 * Every validation happens before the first result is built, so a failure leaves no
 * partial output behind.
 */
class CorePipeline {
public:
    /**
     * @brief Uses --memory-budget-mb when set, otherwise MemAvailable.
     */
    explicit CorePipeline(const Config& config);

    /**
     * @brief Uses an injected memory signal (tests, embedding).
     */
    CorePipeline(const Config& config, std::shared_ptr<const Utils::MemoryProbe> probe);

    /**
     * @throws ThresholdRangeError, EmptyAlignmentError, InsufficientMemoryError
     */
    CoreResult run(const AlignmentPanel& panel) const;

    ClassifierOptions classifier_options() const;
    DistanceConfig distance_config() const;

    const Config& config() const {
        return config_;
    }

private:
    Config config_;
    std::shared_ptr<const Utils::MemoryProbe> probe_;

    std::vector<int> select_output_rows(const AlignmentPanel& panel, const Classification& classification) const;

    void summarize(const AlignmentPanel& panel, const Expander& expander, CoreResult& result) const;
};

}  // namespace PolyCore
