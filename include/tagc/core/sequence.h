// =============================================================================
// tag-counter - Sequence Utilities
// =============================================================================
// Case folding, case-insensitive comparison and reverse complement for
// nucleotide strings.
// =============================================================================

#ifndef TAGC_CORE_SEQUENCE_H
#define TAGC_CORE_SEQUENCE_H

#include <cctype>
#include <string>
#include <string_view>

namespace tagc::core {

/// @brief Lowercase an ASCII character.
[[nodiscard]] inline char toLowerAscii(char c) noexcept {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

/// @brief Lowercase copy of a sequence.
[[nodiscard]] std::string toLower(std::string_view sequence);

/// @brief Case-insensitive equality of two strings.
[[nodiscard]] bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept;

/// @brief Reverse complement of a sequence.
/// @note A/C/G/T are complemented in either case, preserving case. Any other
///       character is kept as is.
[[nodiscard]] std::string reverseComplement(std::string_view sequence);

}  // namespace tagc::core

#endif  // TAGC_CORE_SEQUENCE_H
