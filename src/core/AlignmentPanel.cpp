#include "core/AlignmentPanel.hpp"

#include <algorithm>
#include <sstream>

#include "core/Alphabet.hpp"
#include "core/Errors.hpp"

namespace PolyCore {

void AlignmentPanel::set_reference(const std::string& id, std::string sequence) {
    Sample ref;
    ref.id = id;
    ref.ploidy = 1;
    ref.ploidy_source = PloidySource::EXPLICIT;
    ref.is_reference = true;
    ref.strands.push_back(std::move(sequence));

    if (has_reference()) {
        rows_.front() = std::move(ref);
    } else {
        rows_.insert(rows_.begin(), std::move(ref));
    }
}

void AlignmentPanel::add_sample(const std::string& id, std::vector<std::string> strands, const PloidyCall& call) {
    Sample sample;
    sample.id = id;
    sample.ploidy = call.ploidy;
    sample.ploidy_source = call.source;
    sample.strands = std::move(strands);
    rows_.push_back(std::move(sample));
}

void AlignmentPanel::validate() const {
    if (!has_reference()) {
        throw EmptyAlignmentError("no reference sequence loaded");
    }

    const size_t expected = length();
    if (expected == 0) {
        throw EmptyAlignmentError("reference '" + reference().id + "' has length 0");
    }

    for (const auto& sample : rows_) {
        if (sample.strands.empty()) {
            throw InvalidPloidyError("sample '" + sample.id + "' has no sequence records");
        }
        if (sample.ploidy < 1 || sample.ploidy > Alphabet::kMaxPloidy) {
            throw InvalidPloidyError("sample '" + sample.id + "' has ploidy " + std::to_string(sample.ploidy));
        }
        if (sample.num_strands() != 1 && sample.num_strands() != sample.ploidy) {
            std::ostringstream ss;
            ss << "sample '" << sample.id << "' has " << sample.num_strands() << " copy records but ploidy "
               << sample.ploidy;
            throw InvalidPloidyError(ss.str());
        }
        for (size_t c = 0; c < sample.strands.size(); ++c) {
            if (sample.strands[c].size() != expected) {
                std::ostringstream ss;
                ss << "sample '" << sample.id << "' copy " << (c + 1) << " has length " << sample.strands[c].size()
                   << ", reference has " << expected;
                throw AlignmentLengthMismatchError(ss.str());
            }
        }
    }
}

size_t AlignmentPanel::length() const {
    return has_reference() ? reference().length() : 0;
}

size_t AlignmentPanel::num_strands() const {
    size_t total = 0;
    for (const auto& sample : rows_) {
        total += sample.strands.size();
    }
    return total;
}

int AlignmentPanel::max_sample_ploidy() const {
    int largest = 1;
    for (const auto& sample : rows_) {
        if (!sample.is_reference) {
            largest = std::max(largest, sample.ploidy);
        }
    }
    return largest;
}

}  // namespace PolyCore
