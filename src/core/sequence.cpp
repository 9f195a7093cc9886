// =============================================================================
// tag-counter - Sequence Utilities Implementation
// =============================================================================

#include "tagc/core/sequence.h"

#include <algorithm>
#include <array>

namespace tagc::core {

namespace {

/// @brief Complement lookup table; identity for non-ACGT characters.
constexpr std::array<char, 256> kComplement = []() {
    std::array<char, 256> table{};
    for (int i = 0; i < 256; ++i) {
        table[static_cast<std::size_t>(i)] = static_cast<char>(i);
    }
    table['A'] = 'T';
    table['C'] = 'G';
    table['G'] = 'C';
    table['T'] = 'A';
    table['a'] = 't';
    table['c'] = 'g';
    table['g'] = 'c';
    table['t'] = 'a';
    return table;
}();

}  // namespace

std::string toLower(std::string_view sequence) {
    std::string result(sequence);
    std::transform(result.begin(), result.end(), result.begin(), toLowerAscii);
    return result;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y) { return toLowerAscii(x) == toLowerAscii(y); });
}

std::string reverseComplement(std::string_view sequence) {
    std::string result;
    result.reserve(sequence.length());
    for (auto it = sequence.rbegin(); it != sequence.rend(); ++it) {
        result.push_back(kComplement[static_cast<unsigned char>(*it)]);
    }
    return result;
}

}  // namespace tagc::core
