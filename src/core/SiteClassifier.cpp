#include "core/SiteClassifier.hpp"

#include <omp.h>

#include <array>
#include <sstream>
#include <utility>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace PolyCore {

std::vector<size_t> Classification::positions(SiteSet set) const {
    std::vector<size_t> selected;
    for (const auto& site : sites) {
        if (site.label == SiteClass::CORE_VARIANT || (set == SiteSet::CORE_ALL && site.is_core())) {
            selected.push_back(site.position);
        }
    }
    return selected;
}

std::array<size_t, 4> Classification::invariant_composition() const {
    std::array<size_t, 4> composition{0, 0, 0, 0};
    for (const auto& site : sites) {
        if (site.label != SiteClass::CORE_INVARIANT) {
            continue;
        }
        const int rank = Alphabet::base_rank(SiteClassifier::effective_ref(site));
        if (rank >= 0) {
            composition[rank]++;
        }
    }
    return composition;
}

SampleSiteCall SiteClassifier::call_profile(const AlignmentPanel& panel, const CollapsedPanel& collapsed,
                                            const GenotypeProfile& profile, size_t column, double min_gf) {
    std::array<char, Alphabet::kMaxPloidy + 1> symbols;
    const int num_strands = static_cast<int>(profile.group_ids.size());
    for (int s = 0; s < num_strands; ++s) {
        const SequenceGroup& group = collapsed.group(profile.group_ids[s]);
        symbols[s] = panel.strand(group.representative)[column];
    }
    return call_site(symbols.data(), num_strands, profile.ploidy, min_gf);
}

char SiteClassifier::effective_ref(const SiteStat& site) {
    return Alphabet::is_base(site.ref_symbol) ? site.ref_symbol : site.major_allele;
}

void SiteClassifier::compute_genome_fractions(const AlignmentPanel& panel, const CollapsedPanel& collapsed,
                                              Classification& result) const {
    const int num_profiles = static_cast<int>(collapsed.num_profiles());
    const int64_t length = static_cast<int64_t>(panel.length());

    result.profile_genome_fraction.assign(num_profiles, 0.0);
    result.profile_missing_copies.assign(num_profiles, 0);

#pragma omp parallel for schedule(dynamic) num_threads(options_.num_threads)
    for (int p = 0; p < num_profiles; ++p) {
        const GenotypeProfile& profile = collapsed.profiles[p];
        int64_t present = 0;
        for (int64_t c = 0; c < length; ++c) {
            present += call_profile(panel, collapsed, profile, static_cast<size_t>(c), 0.0).present;
        }
        const int64_t expected = static_cast<int64_t>(profile.ploidy) * length;
        result.profile_genome_fraction[p] = static_cast<double>(present) / static_cast<double>(expected);
        result.profile_missing_copies[p] = static_cast<size_t>(expected - present);
    }

    result.profile_passes_gf.assign(num_profiles, false);
    result.profile_voting_weight.assign(num_profiles, 0);
    result.profile_sample_weight.assign(num_profiles, 0);
    for (int p = 0; p < num_profiles; ++p) {
        result.profile_passes_gf[p] =
            result.profile_genome_fraction[p] + kFractionEpsilon >= options_.thresholds.min_gf;
    }

    for (int row = 0; row < panel.num_rows(); ++row) {
        const int p = collapsed.row_profile[row];
        const Sample& sample = panel.row(row);
        if (sample.is_reference && !options_.include_reference) {
            continue;
        }
        result.profile_sample_weight[p]++;
        if (!result.profile_passes_gf[p]) {
            std::ostringstream ss;
            ss << "Sample '" << sample.id << "' genome fraction " << result.profile_genome_fraction[p]
               << " is below min-gf " << options_.thresholds.min_gf << "; excluded from core voting";
            LOG_WARNING(ss.str());
            continue;
        }
        result.profile_voting_weight[p]++;
        result.voting_rows.push_back(row);
    }
    result.voting_samples = static_cast<int>(result.voting_rows.size());
}

void SiteClassifier::count_profile_sites(const AlignmentPanel& panel, const CollapsedPanel& collapsed,
                                         Classification& result) const {
    const int num_profiles = static_cast<int>(collapsed.num_profiles());
    result.profile_counts.assign(num_profiles, ProfileSiteCounts{});

#pragma omp parallel for schedule(dynamic) num_threads(options_.num_threads)
    for (int p = 0; p < num_profiles; ++p) {
        const GenotypeProfile& profile = collapsed.profiles[p];
        ProfileSiteCounts counts;
        for (const auto& site : result.sites) {
            if (!site.is_core()) {
                continue;
            }
            const SampleSiteCall call =
                call_profile(panel, collapsed, profile, site.position, options_.thresholds.min_gf);
            if (!call.called) {
                continue;
            }
            counts.called_core_sites++;

            if (site.label != SiteClass::CORE_VARIANT) {
                continue;
            }
            const int ref_rank = Alphabet::base_rank(effective_ref(site));
            for (int b = 0; b < Alphabet::kNumBases; ++b) {
                if (b != ref_rank && call.counts[b] > 0) {
                    counts.variant_sites++;
                    break;
                }
            }
        }
        result.profile_counts[p] = counts;
    }
}

Classification SiteClassifier::classify(const AlignmentPanel& panel, const CollapsedPanel& collapsed) const {
    options_.thresholds.validate();
    if (panel.length() == 0) {
        throw EmptyAlignmentError("alignment has no columns");
    }

    Utils::ScopedLogger scope("Classifying " + std::to_string(panel.length()) + " sites");

    Classification result;
    compute_genome_fractions(panel, collapsed, result);

    if (result.voting_samples == 0) {
        LOG_WARNING("No sample passes min-gf; every site is excluded");
    }

    const int64_t length = static_cast<int64_t>(panel.length());
    const std::string& ref_seq = panel.reference().strands.front();
    const int num_profiles = static_cast<int>(collapsed.num_profiles());
    result.sites.resize(panel.length());

#pragma omp parallel for schedule(static) num_threads(options_.num_threads)
    for (int64_t c = 0; c < length; ++c) {
        const size_t column = static_cast<size_t>(c);
        SiteTally tally;
        int64_t present = 0;
        int64_t expected = 0;
        for (int p = 0; p < num_profiles; ++p) {
            const int members = result.profile_sample_weight[p];
            if (members == 0) {
                continue;
            }
            const GenotypeProfile& profile = collapsed.profiles[p];
            const SampleSiteCall call = call_profile(panel, collapsed, profile, column, options_.thresholds.min_gf);
            present += static_cast<int64_t>(members) * call.present;
            expected += static_cast<int64_t>(members) * profile.ploidy;

            const int weight = result.profile_voting_weight[p];
            if (weight > 0) {
                tally = admit(tally, call, profile.ploidy, weight);
            }
        }
        SiteStat stat = classify_site(column, tally, result.voting_samples, ref_seq[column], options_.thresholds,
                                      options_.require_reference_base);
        // Coverage counts every sample, including those below min-gf
        stat.genome_fraction = expected > 0 ? static_cast<double>(present) / static_cast<double>(expected) : 0.0;
        result.sites[column] = std::move(stat);
    }

    for (const auto& site : result.sites) {
        switch (site.label) {
            case SiteClass::CORE_INVARIANT:
                result.num_invariant++;
                break;
            case SiteClass::CORE_VARIANT:
                result.num_variant++;
                break;
            default:
                result.num_excluded++;
                break;
        }
    }

    count_profile_sites(panel, collapsed, result);

    std::ostringstream ss;
    ss << "Sites below min-cf (" << options_.thresholds.min_cf << ") or otherwise excluded: " << result.num_excluded
       << "; core-invariant: " << result.num_invariant << "; core-variant: " << result.num_variant
       << " (min-pf: " << options_.thresholds.min_pf << ", min-pn: " << options_.thresholds.min_pn << ")";
    LOG_INFO(ss.str());

    return result;
}

}  // namespace PolyCore
