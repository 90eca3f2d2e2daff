#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace PolyCore {

/// Per-base copy counts in rank order A, C, G, T.
using AlleleCounts = std::array<int, 4>;

/**
 * @brief IUPAC nucleotide alphabet with 4-bit base masks.
 *
 * A=1, C=2, G=4, T=8; ambiguity codes are the OR of their bases. Any symbol that is
 * not a base or an ambiguity code (N, '-', '?', '.') has mask 0 and counts as missing.
 */
class Alphabet {
public:
    static constexpr int kNumBases = 4;
    static constexpr char kBases[kNumBases] = {'A', 'C', 'G', 'T'};
    static constexpr int kMaxPloidy = 255;

    /// Mask of a symbol (case-insensitive), 0 if missing.
    static uint8_t mask(char symbol);

    /// Number of bases a symbol stands for (0 for missing).
    static int ambiguity_size(char symbol);

    static bool is_missing(char symbol) { return mask(symbol) == 0; }

    /// True for A, C, G, T.
    static bool is_base(char symbol) { return ambiguity_size(symbol) == 1; }

    /// Rank of a base in A<C<G<T, or -1 for anything else.
    static int base_rank(char symbol);

    /// IUPAC symbol of a mask; 'N' for 0.
    static char symbol_of(uint8_t mask);

    /**
     * @brief Decodes a symbol carried by a strand of the given dosage.
     *
     * - popcount 0: no copy observed
     * - popcount 1: all copies carry that base
     * - popcount == dosage: one copy of each base
     * - otherwise the ambiguity cannot be resolved and no copy is observed
     */
    static AlleleCounts decode(char symbol, int dosage);

    /// Largest ambiguity size found in a sequence (at least 1).
    static int max_ambiguity(const std::string& sequence);

    static int total(const AlleleCounts& counts) {
        return counts[0] + counts[1] + counts[2] + counts[3];
    }
};

}  // namespace PolyCore
