#pragma once

#include <cstdint>
#include <string>

namespace PolyCore {

/**
 * @brief Classification label of one alignment column.
 */
enum class SiteClass : uint8_t {
    EXCLUDED = 0,        ///< Core fraction below min-cf (or reference base missing when required)
    CORE_INVARIANT = 1,  ///< Retained site without a qualifying alternate allele
    CORE_VARIANT = 2     ///< Retained site with a qualifying alternate allele (SNP/SNV)
};

/**
 * @brief Which retained sites a downstream step works on.
 */
enum class SiteSet {
    CORE_ALL,     ///< CORE_INVARIANT and CORE_VARIANT
    CORE_VARIANT  ///< CORE_VARIANT only
};

/**
 * @brief Provenance of a sample's ploidy.
 */
enum class PloidySource {
    EXPLICIT,  ///< Set by a user override and checked against the data
    DETECTED   ///< Inferred from strand count or ambiguity codes
};

/**
 * @brief Order in which the progressive core admits samples.
 */
enum class SampleOrder {
    INPUT,                 ///< Order of the input files
    ASCENDING_MISSINGNESS  ///< Most complete genomes first (stable)
};

/**
 * @brief Reduction of per-copy differences to one dissimilarity per site.
 *
 * BEST_MATCH pairs copies so that shared alleles are matched first. MEAN_PAIR averages
 * over all copy pairs.
 */
enum class CopyAggregation {
    BEST_MATCH,
    MEAN_PAIR
};

enum class NanDistanceStrategy {
    MAX_DIST,
    SKIP
};

/**
 * @brief Log level for controlling output verbosity.
 */
enum class LogLevel {
    LOG_ERROR = 0,  ///< Only errors
    LOG_WARN = 1,   ///< Errors and warnings
    LOG_INFO = 2,   ///< Normal operational messages
    LOG_DEBUG = 3   ///< Detailed per-stage output
};

inline std::string site_class_to_string(SiteClass label) {
    switch (label) {
        case SiteClass::EXCLUDED:
            return "EXCLUDED";
        case SiteClass::CORE_INVARIANT:
            return "CORE_INVARIANT";
        case SiteClass::CORE_VARIANT:
            return "CORE_VARIANT";
        default:
            return "UNKNOWN";
    }
}

inline std::string ploidy_source_to_string(PloidySource source) {
    return source == PloidySource::EXPLICIT ? "explicit" : "detected";
}

}  // namespace PolyCore
