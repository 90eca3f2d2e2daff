#pragma once

#include <chrono>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <string>

#ifdef USE_JEMALLOC
#include <jemalloc/jemalloc.h>
#endif

namespace PolyCore {
namespace Utils {

/**
 * @brief Wall time and memory of the current run.
 *
 * Memory is jemalloc's allocated bytes when built with USE_JEMALLOC, otherwise the
 * peak resident set size (VmHWM) read from /proc/self/status.
 */
class ResourceMonitor {
public:
    ResourceMonitor() { reset(); }

    void reset() { start_time_ = std::chrono::steady_clock::now(); }

    double get_elapsed_seconds() const {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time_;
        return elapsed.count();
    }

    /// Bytes in use, 0 when unavailable.
    size_t get_memory_usage() const {
        size_t allocated = 0;
#ifdef USE_JEMALLOC
        size_t sz = sizeof(size_t);
        // stats are cached until the epoch advances
        uint64_t epoch = 1;
        mallctl("epoch", &epoch, &sz, &epoch, sizeof(epoch));
        if (mallctl("stats.allocated", &allocated, &sz, NULL, 0) != 0) {
            allocated = 0;
        }
#else
        FILE* fp = std::fopen("/proc/self/status", "r");
        if (fp == NULL) {
            return 0;
        }
        char line[256];
        unsigned long long kb = 0;
        while (std::fgets(line, sizeof(line), fp)) {
            if (std::sscanf(line, "VmHWM: %llu kB", &kb) == 1) {
                allocated = static_cast<size_t>(kb) * 1024;
                break;
            }
        }
        std::fclose(fp);
#endif
        return allocated;
    }

    std::string format_stats(const std::string& label = "Execution") const {
        std::ostringstream ss;
        ss << "[" << label << "] Time: " << std::fixed << std::setprecision(4) << get_elapsed_seconds() << " s";
#ifdef USE_JEMALLOC
        ss << ", Memory (allocated): ";
#else
        ss << ", Memory (peak RSS): ";
#endif
        ss << std::setprecision(2) << (get_memory_usage() / 1024.0 / 1024.0) << " MB";
        return ss.str();
    }

private:
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace PolyCore
