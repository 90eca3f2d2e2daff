#include "core/ProgressiveCoreTracker.hpp"

#include <omp.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "utils/Logger.hpp"

namespace PolyCore {

ProgressiveCoreTracker::ProgressiveCoreTracker(const AlignmentPanel& panel, const CollapsedPanel& collapsed,
                                               const Classification& classification,
                                               const ClassifierOptions& options, SampleOrder order)
    : panel_(panel), collapsed_(collapsed), options_(options) {
    options_.thresholds.validate();
    build_order(classification, order);
    reset();
}

void ProgressiveCoreTracker::build_order(const Classification& classification, SampleOrder order) {
    order_ = classification.voting_rows;
    if (order != SampleOrder::ASCENDING_MISSINGNESS) {
        return;
    }

    // The reference (when it votes) stays first; samples follow by descending genome fraction
    auto first_sample = order_.begin();
    if (first_sample != order_.end() && panel_.row(*first_sample).is_reference) {
        ++first_sample;
    }
    std::stable_sort(first_sample, order_.end(), [&](int a, int b) {
        return classification.profile_genome_fraction[collapsed_.row_profile[a]] >
               classification.profile_genome_fraction[collapsed_.row_profile[b]];
    });
}

void ProgressiveCoreTracker::reset() {
    const size_t length = panel_.length();
    const std::string& ref_seq = panel_.reference().strands.front();

    tallies_.assign(length, SiteTally{});
    active_.clear();
    active_.reserve(length);
    for (size_t c = 0; c < length; ++c) {
        if (options_.require_reference_base && Alphabet::is_missing(ref_seq[c])) {
            continue;
        }
        active_.push_back(c);
    }
    admitted_ = 0;
}

CoreTrajectoryPoint ProgressiveCoreTracker::next() {
    if (!has_next()) {
        throw std::out_of_range("progressive core: every sample has already been admitted");
    }

    const int row = order_[admitted_];
    const int k = static_cast<int>(admitted_) + 1;
    const GenotypeProfile& profile = collapsed_.profile_of_row(row);
    const std::string& ref_seq = panel_.reference().strands.front();
    const int64_t num_active = static_cast<int64_t>(active_.size());

    std::vector<char> keep(active_.size(), 0);
    size_t variant_sites = 0;

#pragma omp parallel for schedule(static) num_threads(options_.num_threads) reduction(+ : variant_sites)
    for (int64_t i = 0; i < num_active; ++i) {
        const size_t column = active_[i];
        const SampleSiteCall call =
            SiteClassifier::call_profile(panel_, collapsed_, profile, column, options_.thresholds.min_gf);
        tallies_[column] = admit(tallies_[column], call, profile.ploidy);

        const SiteStat stat = classify_site(column, tallies_[column], k, ref_seq[column], options_.thresholds,
                                            options_.require_reference_base);
        if (stat.is_core()) {
            keep[i] = 1;
            if (stat.label == SiteClass::CORE_VARIANT) {
                variant_sites++;
            }
        }
    }

    size_t kept = 0;
    for (size_t i = 0; i < active_.size(); ++i) {
        if (keep[i]) {
            active_[kept++] = active_[i];
        }
    }
    active_.resize(kept);
    admitted_++;

    CoreTrajectoryPoint point;
    point.k = k;
    point.row = row;
    point.sample_id = panel_.row(row).id;
    point.core_sites = active_.size();
    point.variant_sites = variant_sites;
    point.core_fraction = static_cast<double>(active_.size()) / static_cast<double>(panel_.length());

    std::ostringstream ss;
    ss << "  " << k << "/" << order_.size() << ": " << point.sample_id << " (" << std::fixed
       << std::setprecision(2) << point.core_fraction << ")";
    LOG_INFO(ss.str());

    return point;
}

std::vector<CoreTrajectoryPoint> ProgressiveCoreTracker::run() {
    Utils::ScopedLogger scope("Determining soft-core (progressive)");
    reset();

    std::vector<CoreTrajectoryPoint> trajectory;
    trajectory.reserve(order_.size());
    while (has_next()) {
        trajectory.push_back(next());
    }
    return trajectory;
}

}  // namespace PolyCore
