#include "core/ChunkPlanner.hpp"

#include <algorithm>
#include <sstream>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace PolyCore {

ChunkPlan ChunkPlanner::plan(size_t num_sites, int num_samples, std::optional<size_t> explicit_width,
                             const Utils::MemoryProbe* probe) const {
    ChunkPlan result;
    const size_t n = static_cast<size_t>(std::max(num_samples, 1));

    std::optional<size_t> budget;
    if (!explicit_width && probe) {
        budget = probe->available_bytes();
    }

    if (explicit_width) {
        result.width = std::max<size_t>(*explicit_width, 1);
        result.source = "explicit";
    } else if (budget) {
        const size_t accumulators = accumulator_bytes(static_cast<int>(n));
        const size_t width = *budget > accumulators ? (*budget - accumulators) / (2 * n * kCellBytes) : 0;
        if (width < min_width_) {
            std::ostringstream ss;
            ss << "a budget of " << (*budget / (1024.0 * 1024.0)) << " MB leaves room for " << width
               << " columns per chunk across " << n << " samples (minimum " << min_width_
               << "); raise --memory-budget-mb or reduce the number of samples or sites";
            throw InsufficientMemoryError(ss.str());
        }
        result.width = width;
        result.source = "budget";
    } else {
        result.width = kDefaultWidth;
        result.source = "default";
    }

    if (num_sites > 0) {
        result.width = std::min(result.width, num_sites);
    }
    result.num_chunks = num_sites == 0 ? 0 : (num_sites + result.width - 1) / result.width;
    result.working_bytes = working_set_bytes(result.width, static_cast<int>(n));

    std::ostringstream ss;
    ss << "Chunk width " << result.width << " (" << result.source << "), " << result.num_chunks
       << " chunks, working set " << (result.working_bytes / (1024.0 * 1024.0)) << " MB";
    LOG_INFO(ss.str());
    return result;
}

}  // namespace PolyCore
