// =============================================================================
// tag-counter - Tag Matcher
// =============================================================================
// Locates barcode candidates in a read between short flanking anchors, on the
// forward strand and on the reverse-complement strand, and resolves them
// against the barcode reference.
//
// Candidate extraction scans for
//   <5' anchor> [8-16 word characters] <3' anchor>
// and, independently, for
//   rc(<3' anchor>) [8-16 word characters] rc(<5' anchor>)
// whose spans are reverse-complemented back into barcode orientation. Each
// scan is global and left to right: at the leftmost position where the
// pattern fits, the longest span followed by the closing anchor is taken, and
// scanning resumes after the closing anchor. Anchors match case-insensitively.
//
// A read is resolved only when exactly one candidate (duplicates counted) is a
// known barcode.
// =============================================================================

#ifndef TAGC_CORE_TAG_MATCHER_H
#define TAGC_CORE_TAG_MATCHER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "tagc/core/barcode_reference.h"
#include "tagc/core/primer_context.h"

namespace tagc::core {

// =============================================================================
// Match Result
// =============================================================================

/// @brief Classification outcome of a single read.
enum class MatchOutcome : std::uint8_t {
    kResolved = 0,     ///< Exactly one known barcode found
    kNoCandidate = 1,  ///< No known barcode found
    kAmbiguous = 2     ///< More than one known barcode found
};

/// @brief Get string representation of a match outcome.
[[nodiscard]] std::string_view matchOutcomeToString(MatchOutcome outcome) noexcept;

/// @brief Result of classifying one read.
struct MatchResult {
    MatchOutcome outcome = MatchOutcome::kNoCandidate;

    /// @brief Lowercase barcode key; empty unless resolved.
    std::string barcode;

    /// @brief Number of extracted candidates that exist in the reference.
    std::size_t foundCount = 0;

    [[nodiscard]] bool isResolved() const noexcept { return outcome == MatchOutcome::kResolved; }
};

// =============================================================================
// TagMatcher Class
// =============================================================================

/// @brief Stateless read classifier.
///
/// Thread Safety:
/// - classify() and extractCandidates() are const and may run concurrently.
/// - The reference must outlive the matcher.
class TagMatcher {
public:
    TagMatcher(const BarcodeReference& reference, PrimerContext context);

    /// @brief Extract every flanked span of the read, forward spans first.
    /// @return Candidates in barcode orientation, original case preserved.
    [[nodiscard]] std::vector<std::string> extractCandidates(std::string_view sequence) const;

    /// @brief Classify a read sequence.
    [[nodiscard]] MatchResult classify(std::string_view sequence) const;

    [[nodiscard]] const BarcodeReference& reference() const noexcept { return *reference_; }
    [[nodiscard]] const PrimerContext& context() const noexcept { return context_; }

private:
    const BarcodeReference* reference_;
    PrimerContext context_;
};

/// @brief Find all spans of 8-16 word characters enclosed by two anchors.
/// @param sequence Read sequence (any case).
/// @param leftAnchor Opening anchor (lowercase).
/// @param rightAnchor Closing anchor (lowercase).
/// @return Views into @p sequence, in scan order.
[[nodiscard]] std::vector<std::string_view> findFlankedSpans(std::string_view sequence,
                                                             std::string_view leftAnchor,
                                                             std::string_view rightAnchor);

}  // namespace tagc::core

#endif  // TAGC_CORE_TAG_MATCHER_H
