#include "core/Alphabet.hpp"

#include <algorithm>
#include <utility>

namespace PolyCore {

namespace {

struct MaskTable {
    std::array<uint8_t, 256> masks{};
    std::array<uint8_t, 16> popcount{};

    MaskTable() {
        const std::pair<char, uint8_t> codes[] = {
            {'A', 1},         {'C', 2},         {'G', 4},         {'T', 8},         {'R', 1 | 4},
            {'Y', 2 | 8},     {'S', 4 | 2},     {'W', 1 | 8},     {'K', 4 | 8},     {'M', 1 | 2},
            {'B', 2 | 4 | 8}, {'D', 1 | 4 | 8}, {'H', 1 | 2 | 8}, {'V', 1 | 2 | 4},
        };
        for (const auto& code : codes) {
            masks[static_cast<unsigned char>(code.first)] = code.second;
            masks[static_cast<unsigned char>(code.first - 'A' + 'a')] = code.second;
        }
        for (int m = 0; m < 16; ++m) {
            popcount[m] = static_cast<uint8_t>(((m >> 0) & 1) + ((m >> 1) & 1) + ((m >> 2) & 1) + ((m >> 3) & 1));
        }
    }
};

const MaskTable& table() {
    static const MaskTable instance;
    return instance;
}

}  // namespace

uint8_t Alphabet::mask(char symbol) {
    return table().masks[static_cast<unsigned char>(symbol)];
}

int Alphabet::ambiguity_size(char symbol) {
    return table().popcount[mask(symbol)];
}

int Alphabet::base_rank(char symbol) {
    switch (mask(symbol)) {
        case 1:
            return 0;
        case 2:
            return 1;
        case 4:
            return 2;
        case 8:
            return 3;
        default:
            return -1;
    }
}

char Alphabet::symbol_of(uint8_t m) {
    static const char symbols[16] = {'N', 'A', 'C', 'M', 'G', 'R', 'S', 'V', 'T', 'W', 'Y', 'H', 'K', 'D', 'B', 'N'};
    return symbols[m & 0x0F];
}

AlleleCounts Alphabet::decode(char symbol, int dosage) {
    AlleleCounts counts{0, 0, 0, 0};
    const uint8_t m = mask(symbol);
    const int k = table().popcount[m];
    if (k == 0 || dosage <= 0) {
        return counts;
    }

    if (k == 1) {
        counts[base_rank(symbol)] = dosage;
    } else if (k == dosage) {
        for (int b = 0; b < kNumBases; ++b) {
            if (m & (1 << b)) {
                counts[b] = 1;
            }
        }
    }
    return counts;
}

int Alphabet::max_ambiguity(const std::string& sequence) {
    int largest = 1;
    for (char c : sequence) {
        largest = std::max(largest, ambiguity_size(c));
    }
    return largest;
}

}  // namespace PolyCore
