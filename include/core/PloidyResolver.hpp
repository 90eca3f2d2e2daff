#pragma once

#include <optional>
#include <string>
#include <vector>

#include "DataStructs.hpp"

namespace PolyCore {

/**
 * @brief Infers or validates the ploidy of a sample from its raw strands.
 *
 * Detection rules:
 * - several strands (phased records): ploidy = number of strands, all of equal length
 * - one strand (unphased IUPAC genotype): ploidy = largest ambiguity code size
 *
 * An override must agree with the data: it must equal the strand count of a phased
 * sample and cannot be smaller than the largest ambiguity code of an unphased one.
 *
 * Pure functions; nothing is logged or stored.
 */
class PloidyResolver {
public:
    PloidyResolver() = default;
    explicit PloidyResolver(std::optional<int> override_ploidy) : override_(override_ploidy) {}

    /**
     * @brief Resolves the ploidy of one sample.
     * @throws InvalidPloidyError on empty input, inconsistent strands or a conflicting override.
     */
    PloidyCall resolve(const std::string& sample_id, const std::vector<std::string>& strands) const;

    /**
     * @brief Ploidy read from the data alone.
     * @throws InvalidPloidyError if there are no strands or strand lengths differ.
     */
    static int detect(const std::string& sample_id, const std::vector<std::string>& strands);

    /**
     * @brief Raises every detected unphased call to the largest detected unphased ploidy.
     *
     * A diploid genome without heterozygous sites carries no ambiguity codes and would
     * otherwise be read as haploid. Explicit and per-copy calls are left unchanged.
     */
    static std::vector<PloidyCall> harmonize(std::vector<PloidyCall> calls);

    const std::optional<int>& override_ploidy() const {
        return override_;
    }

private:
    std::optional<int> override_;
};

}  // namespace PolyCore
