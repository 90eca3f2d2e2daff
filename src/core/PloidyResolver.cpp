#include "core/PloidyResolver.hpp"

#include <algorithm>
#include <sstream>

#include "core/Alphabet.hpp"
#include "core/Errors.hpp"

namespace PolyCore {

int PloidyResolver::detect(const std::string& sample_id, const std::vector<std::string>& strands) {
    if (strands.empty()) {
        throw InvalidPloidyError("sample '" + sample_id + "' has no sequence records");
    }

    if (strands.size() == 1) {
        return Alphabet::max_ambiguity(strands.front());
    }

    const size_t length = strands.front().size();
    for (size_t c = 1; c < strands.size(); ++c) {
        if (strands[c].size() != length) {
            std::ostringstream ss;
            ss << "sample '" << sample_id << "' copy " << (c + 1) << " covers " << strands[c].size()
               << " positions, copy 1 covers " << length;
            throw InvalidPloidyError(ss.str());
        }
    }
    return static_cast<int>(strands.size());
}

PloidyCall PloidyResolver::resolve(const std::string& sample_id, const std::vector<std::string>& strands) const {
    PloidyCall call;
    call.detected = detect(sample_id, strands);
    call.per_copy = strands.size() > 1;

    if (call.detected > Alphabet::kMaxPloidy) {
        throw InvalidPloidyError("sample '" + sample_id + "' has more than " + std::to_string(Alphabet::kMaxPloidy) +
                                 " copies");
    }

    if (!override_) {
        call.ploidy = call.detected;
        call.source = PloidySource::DETECTED;
        return call;
    }

    const int requested = *override_;
    if (requested < 1 || requested > Alphabet::kMaxPloidy) {
        throw InvalidPloidyError("override " + std::to_string(requested) + " is outside [1, " +
                                 std::to_string(Alphabet::kMaxPloidy) + "]");
    }

    if (call.per_copy && requested != call.detected) {
        std::ostringstream ss;
        ss << "override " << requested << " conflicts with " << call.detected << " copy records of sample '"
           << sample_id << "'";
        throw InvalidPloidyError(ss.str());
    }
    if (!call.per_copy && requested < call.detected) {
        std::ostringstream ss;
        ss << "override " << requested << " conflicts with ambiguity codes of size " << call.detected
           << " in sample '" << sample_id << "'";
        throw InvalidPloidyError(ss.str());
    }

    call.ploidy = requested;
    call.source = PloidySource::EXPLICIT;
    return call;
}

std::vector<PloidyCall> PloidyResolver::harmonize(std::vector<PloidyCall> calls) {
    int panel_ploidy = 0;
    for (const auto& call : calls) {
        if (!call.per_copy && call.source == PloidySource::DETECTED) {
            panel_ploidy = std::max(panel_ploidy, call.ploidy);
        }
    }

    for (auto& call : calls) {
        if (!call.per_copy && call.source == PloidySource::DETECTED) {
            call.ploidy = panel_ploidy;
        }
    }
    return calls;
}

}  // namespace PolyCore
