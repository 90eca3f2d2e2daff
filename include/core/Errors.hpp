#pragma once

#include <stdexcept>
#include <string>

namespace PolyCore {

/**
 * @brief Base class of all input-validation and resource failures.
 *
 * Every error is fatal and raised before any output is written.
 */
class PolyCoreError : public std::runtime_error {
public:
    explicit PolyCoreError(const std::string& what) : std::runtime_error(what) {}
};

/// Copies per sample inconsistent, or an override contradicting the data.
class InvalidPloidyError : public PolyCoreError {
public:
    explicit InvalidPloidyError(const std::string& what) : PolyCoreError("Invalid ploidy: " + what) {}
};

class AlignmentLengthMismatchError : public PolyCoreError {
public:
    explicit AlignmentLengthMismatchError(const std::string& what)
        : PolyCoreError("Alignment length mismatch: " + what) {}
};

class EmptyAlignmentError : public PolyCoreError {
public:
    explicit EmptyAlignmentError(const std::string& what) : PolyCoreError("Empty alignment: " + what) {}
};

/// A fraction threshold outside [0,1] or a negative sample-count threshold.
class ThresholdRangeError : public PolyCoreError {
public:
    explicit ThresholdRangeError(const std::string& what) : PolyCoreError("Threshold out of range: " + what) {}
};

/// The distance chunk width would drop below the minimum viable width.
class InsufficientMemoryError : public PolyCoreError {
public:
    explicit InsufficientMemoryError(const std::string& what) : PolyCoreError("Insufficient memory: " + what) {}
};

}  // namespace PolyCore
