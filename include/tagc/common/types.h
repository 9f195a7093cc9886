// =============================================================================
// tag-counter - Common Type Definitions
// =============================================================================
// Core type aliases and constants shared across the tag-counter library.
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef TAGC_COMMON_TYPES_H
#define TAGC_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tagc {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Type alias for read counts.
using Count = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Shortest barcode accepted in the reference and in a read.
inline constexpr std::size_t kMinBarcodeLength = 8;

/// @brief Longest barcode accepted in the reference and in a read.
inline constexpr std::size_t kMaxBarcodeLength = 16;

/// @brief Number of context bases directly adjacent to the barcode used as anchor.
inline constexpr std::size_t kAnchorLength = 5;

/// @brief Row key collecting every read that did not resolve to exactly one barcode.
inline constexpr std::string_view kNoMatchKey = "no_match";

/// @brief Barcode value marking a gene without a designed tag.
inline constexpr std::string_view kNoTagMarker = "none";

/// @brief Tag amplification (BA) primer, 5' of the barcode.
inline constexpr std::string_view kDefaultFivePrimeContext = "GTAATTCGTGCGCGTCAG";

/// @brief Cassette sequence from primer R2 to the arg97 primer binding site, 3' of
///        the barcode. Identical for all constructs.
inline constexpr std::string_view kDefaultThreePrimeContext =
    "CCGCCTACTGCGACTATAGAGATATCAACCACTTTGTACAAGAAAGCTGGGTGGTACCCATCGAAATTGAAGG";

/// @brief Number of reads classified per parallel batch.
inline constexpr std::size_t kDefaultChunkSize = 10'000;

}  // namespace tagc

#endif  // TAGC_COMMON_TYPES_H
