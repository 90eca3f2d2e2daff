#include "core/Expander.hpp"

#include <algorithm>
#include <sstream>

#include "utils/Logger.hpp"

namespace PolyCore {

const std::string& Expander::expand_strand(const StrandId& id) const {
    const SequenceGroup& group = collapsed_.group(collapsed_.group_of(id));
    return panel_.strand(group.representative);
}

ExpandedAlignment Expander::expand_sites(const Classification& classification, SiteSet site_set,
                                         const std::vector<int>& rows) const {
    ExpandedAlignment result;
    result.positions = classification.positions(site_set);
    result.samples.reserve(rows.size());

    for (int row : rows) {
        const Sample& sample = panel_.row(row);
        ExpandedSample expanded;
        expanded.row = row;
        expanded.id = sample.id;
        expanded.ploidy = sample.ploidy;
        expanded.strands.reserve(sample.strands.size());

        for (int copy = 0; copy < sample.num_strands(); ++copy) {
            const std::string& full = expand_strand(StrandId{row, copy});
            std::string selected;
            selected.reserve(result.positions.size());
            for (size_t column : result.positions) {
                selected.push_back(full[column]);
            }
            expanded.strands.push_back(std::move(selected));
        }
        result.samples.push_back(std::move(expanded));
    }

    std::ostringstream ss;
    ss << "Expanded " << result.samples.size() << " samples over " << result.positions.size()
       << (site_set == SiteSet::CORE_ALL ? " core" : " core-variant") << " sites";
    LOG_DEBUG(ss.str());
    return result;
}

std::vector<VariantRecord> Expander::variant_records(const Classification& classification,
                                                     const ExpandedAlignment& alignment) {
    std::vector<VariantRecord> records;

    for (size_t i = 0; i < alignment.positions.size(); ++i) {
        const SiteStat& site = classification.sites.at(alignment.positions[i]);
        if (site.label != SiteClass::CORE_VARIANT) {
            continue;
        }

        VariantRecord record;
        record.position = site.position;
        record.ref = SiteClassifier::effective_ref(site);
        const int ref_rank = Alphabet::base_rank(record.ref);

        // Observed copies of every output sample, so no genotype points outside ALT
        std::vector<AlleleCounts> calls;
        calls.reserve(alignment.samples.size());
        AlleleCounts observed{0, 0, 0, 0};
        for (const auto& sample : alignment.samples) {
            AlleleCounts sample_counts{0, 0, 0, 0};
            for (const auto& strand : sample.strands) {
                const AlleleCounts counts = Alphabet::decode(strand[i], sample.dosage());
                for (int b = 0; b < Alphabet::kNumBases; ++b) {
                    sample_counts[b] += counts[b];
                }
            }
            for (int b = 0; b < Alphabet::kNumBases; ++b) {
                observed[b] += sample_counts[b];
            }
            calls.push_back(sample_counts);
        }
        for (char alt : site.alt_alleles) {
            observed[Alphabet::base_rank(alt)]++;
        }
        if (Alphabet::is_base(site.major_allele)) {
            observed[Alphabet::base_rank(site.major_allele)]++;
        }

        int allele_index[Alphabet::kNumBases] = {-1, -1, -1, -1};
        allele_index[ref_rank] = 0;
        for (int b = 0; b < Alphabet::kNumBases; ++b) {
            if (b != ref_rank && observed[b] > 0) {
                record.alts.push_back(Alphabet::kBases[b]);
                allele_index[b] = static_cast<int>(record.alts.size());
            }
        }

        for (size_t s = 0; s < alignment.samples.size(); ++s) {
            const ExpandedSample& sample = alignment.samples[s];
            std::vector<int> genotype;
            genotype.reserve(sample.ploidy);

            if (sample.num_strands() > 1) {
                for (const auto& strand : sample.strands) {
                    const int rank = Alphabet::base_rank(strand[i]);
                    genotype.push_back(rank >= 0 ? allele_index[rank] : -1);
                }
            } else if (Alphabet::total(calls[s]) == 0) {
                genotype.assign(sample.ploidy, -1);
            } else {
                for (int b = 0; b < Alphabet::kNumBases; ++b) {
                    genotype.insert(genotype.end(), calls[s][b], allele_index[b]);
                }
                std::sort(genotype.begin(), genotype.end());
            }

            record.genotypes.push_back(std::move(genotype));
            record.phased.push_back(sample.num_strands() > 1);
        }
        records.push_back(std::move(record));
    }

    return records;
}

}  // namespace PolyCore
