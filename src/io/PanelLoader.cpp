#include "io/PanelLoader.hpp"

#include <set>
#include <sstream>

#include "core/Errors.hpp"
#include "core/PloidyResolver.hpp"
#include "io/FastaLoader.hpp"
#include "utils/Logger.hpp"

namespace PolyCore {

SampleInput PanelLoader::read_sample(const std::string& path, size_t reference_length) const {
    FastaLoader fasta(path);
    SampleInput input;
    input.id = FastaLoader::sample_name(path);

    if (phased_records_) {
        for (auto& record : fasta.read_all()) {
            input.strands.push_back(std::move(record.sequence));
        }
    } else {
        input.strands.push_back(fasta.read_concatenated());
    }

    for (const auto& strand : input.strands) {
        if (strand.size() != reference_length) {
            std::ostringstream ss;
            ss << "sample length (" << strand.size() << ") differs from the reference (" << reference_length
               << "): " << path;
            throw AlignmentLengthMismatchError(ss.str());
        }
    }
    return input;
}

AlignmentPanel PanelLoader::load(const std::string& reference_path, const std::vector<std::string>& sample_paths) const {
    Utils::ScopedLogger scope("Loading " + std::to_string(sample_paths.size() + 1) + " FASTA files");

    std::string reference = FastaLoader(reference_path).read_concatenated();
    LOG_INFO("  1/" + std::to_string(sample_paths.size() + 1) + ": " + kReferenceId + " (" +
             std::to_string(reference.size()) + " bp)");

    std::vector<SampleInput> samples;
    samples.reserve(sample_paths.size());
    for (size_t i = 0; i < sample_paths.size(); ++i) {
        samples.push_back(read_sample(sample_paths[i], reference.size()));
        LOG_INFO("  " + std::to_string(i + 2) + "/" + std::to_string(sample_paths.size() + 1) + ": " +
                 samples.back().id + " (" + std::to_string(samples.back().strands.size()) + " records)");
    }

    return build(kReferenceId, std::move(reference), std::move(samples));
}

AlignmentPanel PanelLoader::build(const std::string& reference_id, std::string reference_sequence,
                                  std::vector<SampleInput> samples) const {
    PloidyResolver resolver(ploidy_);
    std::vector<PloidyCall> calls;
    calls.reserve(samples.size());
    for (const auto& sample : samples) {
        calls.push_back(resolver.resolve(sample.id, sample.strands));
    }
    calls = PloidyResolver::harmonize(std::move(calls));

    AlignmentPanel panel;
    panel.set_reference(reference_id, std::move(reference_sequence));

    std::set<std::string> used_ids = {reference_id};
    for (size_t i = 0; i < samples.size(); ++i) {
        std::string id = samples[i].id;
        for (int suffix = 2; used_ids.count(id) > 0; ++suffix) {
            id = samples[i].id + "_" + std::to_string(suffix);
        }
        if (id != samples[i].id) {
            LOG_WARNING("Duplicate sample name '" + samples[i].id + "' renamed to '" + id + "'");
        }
        used_ids.insert(id);

        std::ostringstream ss;
        ss << "Ploidy of " << id << ": " << calls[i].ploidy << " (" << ploidy_source_to_string(calls[i].source)
           << (calls[i].per_copy ? ", phased records" : "") << ")";
        LOG_DEBUG(ss.str());

        panel.add_sample(id, std::move(samples[i].strands), calls[i]);
    }

    panel.validate();
    LOG_INFO("Loaded " + std::to_string(panel.num_rows()) + " sequences, alignment length " +
             std::to_string(panel.length()) + ", max ploidy " + std::to_string(panel.max_sample_ploidy()));
    return panel;
}

}  // namespace PolyCore
