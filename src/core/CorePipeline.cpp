#include "core/CorePipeline.hpp"

#include <algorithm>
#include <iomanip>
#include <optional>
#include <sstream>

#include "core/ProgressiveCoreTracker.hpp"
#include "utils/Logger.hpp"

namespace PolyCore {

CorePipeline::CorePipeline(const Config& config) : config_(config) {
    if (config_.memory_budget_mb > 0) {
        probe_ = std::make_shared<Utils::FixedMemoryProbe>(
            Utils::FixedMemoryProbe::from_megabytes(config_.memory_budget_mb));
    } else {
        probe_ = std::make_shared<Utils::SystemMemoryProbe>();
    }
}

CorePipeline::CorePipeline(const Config& config, std::shared_ptr<const Utils::MemoryProbe> probe)
    : config_(config), probe_(std::move(probe)) {}

ClassifierOptions CorePipeline::classifier_options() const {
    ClassifierOptions options;
    options.thresholds = config_.thresholds();
    options.include_reference = config_.include_reference;
    options.require_reference_base = config_.require_reference_base;
    options.num_threads = config_.threads;
    return options;
}

DistanceConfig CorePipeline::distance_config() const {
    DistanceConfig dc;
    dc.site_set = config_.distance_sites;
    dc.aggregation = config_.copy_aggregation;
    dc.nan_strategy = config_.nan_distance_strategy;
    dc.max_distance_value = config_.max_distance_value;
    dc.min_common_sites = config_.min_common_sites;
    dc.min_gf = config_.min_gf;
    dc.num_threads = config_.threads;
    return dc;
}

std::vector<int> CorePipeline::select_output_rows(const AlignmentPanel& panel,
                                                  const Classification& classification) const {
    std::vector<int> rows = {0};
    for (int row : classification.voting_rows) {
        if (!panel.row(row).is_reference) {
            rows.push_back(row);
        }
    }
    return rows;
}

CoreResult CorePipeline::run(const AlignmentPanel& panel) const {
    const ClassifierOptions options = classifier_options();
    options.thresholds.validate();
    panel.validate();

    CoreResult result;

    // 1. Collapse identical strands
    {
        Utils::ScopedLogger scope("Collapsing " + std::to_string(panel.num_strands()) + " strands");
        result.collapsed = SequenceCollapser().collapse(panel);
        SequenceCollapser::report(panel, result.collapsed);
    }

    // 2. Classify every column
    SiteClassifier classifier(options);
    result.classification = classifier.classify(panel, result.collapsed);
    const Classification& classification = result.classification;

    const size_t core_sites = classification.num_invariant + classification.num_variant;
    result.final_core_fraction = static_cast<double>(core_sites) / static_cast<double>(panel.length());

    // 3. Soft-core trajectory
    if (config_.progressive) {
        ProgressiveCoreTracker tracker(panel, result.collapsed, classification, options, config_.sample_order);
        result.trajectory = tracker.run();
    }

    std::ostringstream ss;
    ss << "Final core fraction: " << std::fixed << std::setprecision(2) << result.final_core_fraction << " ("
       << core_sites << " of " << panel.length() << " sites)";
    LOG_INFO(ss.str());

    // 4. Expand back to samples
    Expander expander(panel, result.collapsed);
    result.output_rows = select_output_rows(panel, classification);
    result.core_alignment = expander.expand_sites(classification, SiteSet::CORE_ALL, result.output_rows);
    result.variant_alignment = expander.expand_sites(classification, SiteSet::CORE_VARIANT, result.output_rows);
    result.variants = Expander::variant_records(classification, result.variant_alignment);

    // 5. Distances in memory-bounded chunks
    const ExpandedAlignment& compared =
        config_.distance_sites == SiteSet::CORE_ALL ? result.core_alignment : result.variant_alignment;
    std::optional<size_t> explicit_width;
    if (config_.chunk_size > 0) {
        explicit_width = config_.chunk_size;
    }
    result.chunk_plan = ChunkPlanner().plan(compared.num_sites(), compared.num_samples(), explicit_width, probe_.get());
    result.distances = DistanceCalculator(distance_config()).compute(compared, result.chunk_plan.width);

    // 6. Constant sites for tree builders
    int max_voting_ploidy = 1;
    for (int row : classification.voting_rows) {
        max_voting_ploidy = std::max(max_voting_ploidy, panel.row(row).ploidy);
    }
    result.fconst = classification.invariant_composition();
    for (auto& count : result.fconst) {
        count *= static_cast<size_t>(max_voting_ploidy);
    }

    summarize(panel, expander, result);
    return result;
}

void CorePipeline::summarize(const AlignmentPanel& panel, const Expander& expander, CoreResult& result) const {
    const Classification& classification = result.classification;

    if (classification.voting_samples == 0) {
        result.warnings.push_back("No sample passes min-gf " + std::to_string(config_.min_gf) +
                                  "; every site is excluded");
    }
    if (classification.num_invariant + classification.num_variant == 0) {
        result.warnings.push_back("The core is empty");
    }
    if (result.distances.num_invalid_pairs > 0) {
        result.warnings.push_back(std::to_string(result.distances.num_invalid_pairs) +
                                  " sample pairs have fewer than " + std::to_string(config_.min_common_sites) +
                                  " common core sites");
    }

    std::vector<double> admitted_fraction(panel.num_rows(), -1.0);
    for (const auto& point : result.trajectory) {
        admitted_fraction[point.row] = point.core_fraction;
    }
    std::vector<bool> voting(panel.num_rows(), false);
    for (int row : classification.voting_rows) {
        voting[row] = true;
    }
    std::vector<bool> output(panel.num_rows(), false);
    for (int row : result.output_rows) {
        output[row] = true;
    }

    const std::vector<double> genome_fraction = expander.project(classification.profile_genome_fraction);
    const std::vector<size_t> missing_copies = expander.project(classification.profile_missing_copies);
    const std::vector<ProfileSiteCounts> counts = expander.project(classification.profile_counts);
    const std::vector<bool> passes_gf = expander.project(classification.profile_passes_gf);

    result.summaries.clear();
    result.summaries.reserve(panel.num_rows());
    for (int row = 0; row < panel.num_rows(); ++row) {
        const Sample& sample = panel.row(row);

        SampleSummary summary;
        summary.id = sample.id;
        summary.ploidy = sample.ploidy;
        summary.ploidy_source = sample.ploidy_source;
        summary.length = panel.length();
        summary.missing_copies = missing_copies[row];
        summary.genome_fraction = genome_fraction[row];
        summary.called_core_sites = counts[row].called_core_sites;
        summary.variant_sites = counts[row].variant_sites;
        summary.voting = voting[row];

        if (admitted_fraction[row] >= 0.0) {
            summary.core_fraction = admitted_fraction[row];
        } else if (output[row]) {
            summary.core_fraction = result.final_core_fraction;
        }

        if (!passes_gf[row] && (!sample.is_reference || config_.include_reference)) {
            std::ostringstream ss;
            ss << "genome fraction " << std::fixed << std::setprecision(4) << summary.genome_fraction
               << " below min-gf " << config_.min_gf << "; excluded from core voting";
            summary.warning = ss.str();
            result.warnings.push_back(sample.id + ": " + summary.warning);
        }

        result.summaries.push_back(std::move(summary));
    }
}

}  // namespace PolyCore
