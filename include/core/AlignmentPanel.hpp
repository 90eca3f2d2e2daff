#pragma once

#include <string>
#include <vector>

#include "DataStructs.hpp"

namespace PolyCore {

/**
 * @brief The reference (row 0) plus the ordered samples of one run.
 *
 * Read-only once loaded. Every strand of every row has the same length L.
 */
class AlignmentPanel {
public:
    AlignmentPanel() = default;

    /**
     * @brief Sets the reference row (ploidy 1, one strand).
     */
    void set_reference(const std::string& id, std::string sequence);

    /**
     * @brief Appends a sample whose ploidy has already been resolved.
     */
    void add_sample(const std::string& id, std::vector<std::string> strands, const PloidyCall& call);

    /**
     * @brief Checks the panel before computation.
     *
     * @throws EmptyAlignmentError if there is no reference or L == 0.
     * @throws AlignmentLengthMismatchError if any strand differs from the reference length.
     * @throws InvalidPloidyError if a row's strand count does not fit its ploidy.
     */
    void validate() const;

    const std::vector<Sample>& rows() const {
        return rows_;
    }
    const Sample& row(int index) const {
        return rows_.at(index);
    }
    const Sample& reference() const {
        return rows_.front();
    }
    bool has_reference() const {
        return !rows_.empty() && rows_.front().is_reference;
    }
    int num_rows() const {
        return static_cast<int>(rows_.size());
    }
    int num_samples() const {
        return has_reference() ? num_rows() - 1 : num_rows();
    }

    /// Alignment length L (reference length).
    size_t length() const;

    /// Total number of strands over all rows.
    size_t num_strands() const;

    const std::string& strand(const StrandId& id) const {
        return rows_.at(id.row).strands.at(id.copy);
    }

    /// Largest ploidy among non-reference rows (1 if there are none).
    int max_sample_ploidy() const;

private:
    std::vector<Sample> rows_;
};

}  // namespace PolyCore
