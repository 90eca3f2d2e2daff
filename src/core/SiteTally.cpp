#include "core/SiteTally.hpp"

#include <sstream>

#include "core/Errors.hpp"

namespace PolyCore {

void CoreThresholds::validate() const {
    auto check_fraction = [](const char* name, double value) {
        if (!(value >= 0.0 && value <= 1.0)) {
            std::ostringstream ss;
            ss << name << "=" << value << " (expected a fraction in [0, 1])";
            throw ThresholdRangeError(ss.str());
        }
    };
    check_fraction("min-gf", min_gf);
    check_fraction("min-cf", min_cf);
    check_fraction("min-pf", min_pf);

    if (min_pn < 0) {
        throw ThresholdRangeError("min-pn=" + std::to_string(min_pn) + " (expected a non-negative count)");
    }
}

SampleSiteCall call_site(const char* symbols, int num_strands, int ploidy, double min_gf) {
    SampleSiteCall call;
    const int dosage = num_strands == 1 ? ploidy : 1;

    for (int s = 0; s < num_strands; ++s) {
        const AlleleCounts counts = Alphabet::decode(symbols[s], dosage);
        for (int b = 0; b < Alphabet::kNumBases; ++b) {
            call.counts[b] += counts[b];
        }
    }
    call.present = Alphabet::total(call.counts);

    const double fraction = ploidy > 0 ? static_cast<double>(call.present) / ploidy : 0.0;
    call.called = call.present > 0 && fraction + kFractionEpsilon >= min_gf;
    return call;
}

SiteTally admit(SiteTally tally, const SampleSiteCall& call, int ploidy, int weight) {
    tally.admitted_samples += weight;
    tally.present_copies += static_cast<int64_t>(weight) * call.present;
    tally.expected_copies += static_cast<int64_t>(weight) * ploidy;

    if (!call.called) {
        return tally;
    }

    tally.called_samples += weight;
    for (int b = 0; b < Alphabet::kNumBases; ++b) {
        if (call.counts[b] > 0) {
            tally.copies[b] += weight * call.counts[b];
            tally.carriers[b] += weight;
        }
    }
    return tally;
}

bool passes_core(const SiteTally& tally, int voting_samples, double min_cf) {
    if (voting_samples <= 0) {
        return false;
    }
    const double fraction = static_cast<double>(tally.called_samples) / voting_samples;
    return fraction + kFractionEpsilon >= min_cf;
}

SiteStat classify_site(size_t position, const SiteTally& tally, int voting_samples, char ref_symbol,
                       const CoreThresholds& thresholds, bool require_reference_base) {
    SiteStat stat;
    stat.position = position;
    stat.ref_symbol = ref_symbol;
    stat.called_samples = tally.called_samples;
    stat.called_copies = tally.called_copies();
    stat.genome_fraction = tally.expected_copies > 0
                               ? static_cast<double>(tally.present_copies) / static_cast<double>(tally.expected_copies)
                               : 0.0;
    stat.core_fraction = voting_samples > 0 ? static_cast<double>(tally.called_samples) / voting_samples : 0.0;

    // Major allele: most copies, then the reference base, then the lowest rank
    const int ref_rank = Alphabet::base_rank(ref_symbol);
    int major = -1;
    for (int b = 0; b < Alphabet::kNumBases; ++b) {
        if (tally.copies[b] == 0) {
            continue;
        }
        if (major < 0 || tally.copies[b] > tally.copies[major] ||
            (tally.copies[b] == tally.copies[major] && b == ref_rank)) {
            major = b;
        }
    }

    int alt = -1;
    for (int b = 0; b < Alphabet::kNumBases; ++b) {
        if (b == major || tally.copies[b] == 0) {
            continue;
        }
        stat.alt_alleles.push_back(Alphabet::kBases[b]);
        if (alt < 0 || tally.copies[b] > tally.copies[alt]) {
            alt = b;
        }
    }

    if (major >= 0) {
        stat.major_allele = Alphabet::kBases[major];
        stat.fixed_difference = ref_rank >= 0 && tally.copies[ref_rank] == 0;
    }
    if (alt >= 0) {
        stat.alt_allele = Alphabet::kBases[alt];
        stat.alt_fraction = static_cast<double>(tally.copies[alt]) / stat.called_copies;
        stat.alt_sample_count = tally.carriers[alt];
    }

    if (require_reference_base && Alphabet::is_missing(ref_symbol)) {
        stat.label = SiteClass::EXCLUDED;
    } else if (!passes_core(tally, voting_samples, thresholds.min_cf)) {
        stat.label = SiteClass::EXCLUDED;
    } else if (alt >= 0 && stat.alt_fraction + kFractionEpsilon >= thresholds.min_pf &&
               stat.alt_sample_count >= thresholds.min_pn) {
        stat.label = SiteClass::CORE_VARIANT;
    } else if (stat.fixed_difference && stat.called_samples >= thresholds.min_pn) {
        stat.label = SiteClass::CORE_VARIANT;
    } else {
        stat.label = SiteClass::CORE_INVARIANT;
    }
    return stat;
}

}  // namespace PolyCore
