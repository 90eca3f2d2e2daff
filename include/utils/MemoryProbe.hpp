#pragma once

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <optional>
#include <string>
#include <utility>

namespace PolyCore {
namespace Utils {

/**
 * @brief Source of the memory budget used to size distance chunks.
 *
 * An empty result means no signal; callers fall back to a fixed default.
 */
class MemoryProbe {
public:
    virtual ~MemoryProbe() = default;

    /// Bytes the computation may use, if known.
    virtual std::optional<size_t> available_bytes() const = 0;
};

/**
 * @brief Reads MemAvailable from /proc/meminfo and keeps a safety fraction of it.
 */
class SystemMemoryProbe : public MemoryProbe {
public:
    explicit SystemMemoryProbe(double safety_fraction = 0.8, std::string meminfo_path = "/proc/meminfo")
        : safety_fraction_(safety_fraction), meminfo_path_(std::move(meminfo_path)) {}

    std::optional<size_t> available_bytes() const override {
        std::ifstream meminfo(meminfo_path_);
        if (!meminfo.is_open()) {
            return std::nullopt;
        }

        std::string line;
        while (std::getline(meminfo, line)) {
            if (line.compare(0, 13, "MemAvailable:") == 0) {
                unsigned long long available_kb = 0;
                if (sscanf(line.c_str(), "MemAvailable: %llu", &available_kb) != 1 || available_kb == 0) {
                    return std::nullopt;
                }
                return static_cast<size_t>(static_cast<double>(available_kb) * 1024.0 * safety_fraction_);
            }
        }
        return std::nullopt;
    }

private:
    double safety_fraction_;
    std::string meminfo_path_;
};

/**
 * @brief A configured budget (--memory-budget-mb), or a fixed value in tests.
 */
class FixedMemoryProbe : public MemoryProbe {
public:
    explicit FixedMemoryProbe(std::optional<size_t> bytes) : bytes_(bytes) {}

    static FixedMemoryProbe from_megabytes(size_t megabytes) {
        return FixedMemoryProbe(megabytes * 1024 * 1024);
    }

    std::optional<size_t> available_bytes() const override {
        return bytes_;
    }

private:
    std::optional<size_t> bytes_;
};

}  // namespace Utils
}  // namespace PolyCore
