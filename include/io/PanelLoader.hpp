#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/AlignmentPanel.hpp"

namespace PolyCore {

/**
 * @brief Raw strands of one sample before ploidy resolution.
 */
struct SampleInput {
    std::string id;
    std::vector<std::string> strands;
};

/**
 * @brief Builds a validated AlignmentPanel from FASTA files or in-memory strands.
 *
 * Samples are named after their file (basename without extension) and the reference is
 * named "Reference". By default the records of a file are joined into one genome; with
 * phased records every record is one allele copy.
 */
class PanelLoader {
public:
    static constexpr const char* kReferenceId = "Reference";

    PanelLoader(std::optional<int> ploidy, bool phased_records) : ploidy_(ploidy), phased_records_(phased_records) {}

    /**
     * @brief Reads the reference and every sample file.
     *
     * @throws std::runtime_error if a file cannot be read.
     * @throws AlignmentLengthMismatchError if a sample differs from the reference length.
     * @throws InvalidPloidyError, EmptyAlignmentError as AlignmentPanel::validate().
     */
    AlignmentPanel load(const std::string& reference_path, const std::vector<std::string>& sample_paths) const;

    /**
     * @brief Resolves ploidy for each sample and assembles the panel.
     */
    AlignmentPanel build(const std::string& reference_id, std::string reference_sequence,
                         std::vector<SampleInput> samples) const;

private:
    std::optional<int> ploidy_;
    bool phased_records_;

    SampleInput read_sample(const std::string& path, size_t reference_length) const;
};

}  // namespace PolyCore
