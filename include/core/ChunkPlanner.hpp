#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "utils/MemoryProbe.hpp"

namespace PolyCore {

/**
 * @brief Chosen chunk width and the memory it implies.
 */
struct ChunkPlan {
    size_t width = 0;          ///< Columns per chunk
    size_t num_chunks = 0;
    size_t working_bytes = 0;  ///< Chunk buffers plus accumulators, excluding the expanded alignments
    std::string source;        ///< "explicit", "budget" or "default"
};

/**
 * @brief Sizes distance chunks so that one chunk fits the memory budget.
 *
 * A chunk holds one packed cell per (column, sample) plus a scratch buffer of the same
 * size; the N x N accumulators (double difference sums and int compared counts) are
 * resident for the whole run:
 *
 *   2 * width * N * kCellBytes + N * N * kAccumulatorBytes <= budget
 *
 * An explicit width wins over the probe. Without any signal the default width is used.
 * The budget covers the distance pass only. The expanded core alignments the chunks are
 * packed from (sites x rows x copies bytes each) are held for the output files and are
 * not counted, so peak memory is higher than `working_bytes` by their size.
 */
class ChunkPlanner {
public:
    static constexpr size_t kDefaultWidth = 1000;
    static constexpr size_t kCellBytes = sizeof(uint32_t);
    static constexpr size_t kAccumulatorBytes = sizeof(double) + sizeof(int32_t);

    explicit ChunkPlanner(size_t min_width = 1) : min_width_(min_width == 0 ? 1 : min_width) {}

    /**
     * @param num_sites Columns to process.
     * @param num_samples Rows of the distance matrix.
     * @param explicit_width Width requested by the user, if any.
     * @param probe Memory signal; may be null.
     * @throws InsufficientMemoryError when the budget cannot hold the accumulators plus
     *         a chunk of the minimum width.
     */
    ChunkPlan plan(size_t num_sites, int num_samples, std::optional<size_t> explicit_width,
                   const Utils::MemoryProbe* probe) const;

    static size_t accumulator_bytes(int num_samples) {
        const size_t n = static_cast<size_t>(num_samples);
        return n * n * kAccumulatorBytes;
    }

    static size_t working_set_bytes(size_t width, int num_samples) {
        return 2 * width * static_cast<size_t>(num_samples) * kCellBytes + accumulator_bytes(num_samples);
    }

    size_t min_width() const {
        return min_width_;
    }

private:
    size_t min_width_;
};

}  // namespace PolyCore
