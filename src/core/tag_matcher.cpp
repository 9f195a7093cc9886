// =============================================================================
// tag-counter - Tag Matcher Implementation
// =============================================================================

#include "tagc/core/tag_matcher.h"

#include <algorithm>
#include <cctype>
#include <utility>

#include "tagc/common/types.h"
#include "tagc/core/sequence.h"

namespace tagc::core {

namespace {

[[nodiscard]] bool isWordChar(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

/// @brief Case-insensitive match of a lowercase anchor at a position.
[[nodiscard]] bool anchorAt(std::string_view sequence, std::size_t pos,
                            std::string_view anchor) noexcept {
    if (pos > sequence.size() || sequence.size() - pos < anchor.size()) {
        return false;
    }
    for (std::size_t i = 0; i < anchor.size(); ++i) {
        if (toLowerAscii(sequence[pos + i]) != anchor[i]) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string_view matchOutcomeToString(MatchOutcome outcome) noexcept {
    switch (outcome) {
        case MatchOutcome::kResolved:
            return "resolved";
        case MatchOutcome::kNoCandidate:
            return "no candidate";
        case MatchOutcome::kAmbiguous:
            return "ambiguous";
        default:
            return "unknown";
    }
}

std::vector<std::string_view> findFlankedSpans(std::string_view sequence,
                                               std::string_view leftAnchor,
                                               std::string_view rightAnchor) {
    std::vector<std::string_view> spans;
    const std::size_t minMatch = leftAnchor.size() + kMinBarcodeLength + rightAnchor.size();

    std::size_t pos = 0;
    while (sequence.size() >= minMatch && pos <= sequence.size() - minMatch) {
        if (!anchorAt(sequence, pos, leftAnchor)) {
            ++pos;
            continue;
        }

        const std::size_t spanStart = pos + leftAnchor.size();

        // Longest run of word characters the span may cover
        std::size_t run = 0;
        while (run < kMaxBarcodeLength && spanStart + run < sequence.size() &&
               isWordChar(sequence[spanStart + run])) {
            ++run;
        }

        bool matched = false;
        for (std::size_t len = run; len >= kMinBarcodeLength; --len) {
            if (anchorAt(sequence, spanStart + len, rightAnchor)) {
                spans.push_back(sequence.substr(spanStart, len));
                pos = spanStart + len + rightAnchor.size();
                matched = true;
                break;
            }
        }

        if (!matched) {
            ++pos;
        }
    }

    return spans;
}

TagMatcher::TagMatcher(const BarcodeReference& reference, PrimerContext context)
    : reference_(&reference), context_(std::move(context)) {}

std::vector<std::string> TagMatcher::extractCandidates(std::string_view sequence) const {
    std::vector<std::string> candidates;

    for (auto span : findFlankedSpans(sequence, context_.fivePrimeAnchor(),
                                      context_.threePrimeAnchor())) {
        candidates.emplace_back(span);
    }

    for (auto span : findFlankedSpans(sequence, context_.threePrimeAnchorRc(),
                                      context_.fivePrimeAnchorRc())) {
        candidates.push_back(reverseComplement(span));
    }

    return candidates;
}

MatchResult TagMatcher::classify(std::string_view sequence) const {
    MatchResult result;

    std::vector<std::string> existing;
    for (auto& candidate : extractCandidates(sequence)) {
        std::string key = toLower(candidate);
        if (reference_->geneForKey(key) != nullptr) {
            existing.push_back(std::move(key));
        }
    }

    result.foundCount = existing.size();
    if (existing.size() == 1) {
        result.outcome = MatchOutcome::kResolved;
        result.barcode = std::move(existing.front());
    } else if (existing.empty()) {
        result.outcome = MatchOutcome::kNoCandidate;
    } else {
        result.outcome = MatchOutcome::kAmbiguous;
    }

    return result;
}

}  // namespace tagc::core
