// =============================================================================
// tag-counter - Tag Matcher Property Tests
// =============================================================================
// Reads are built from an A/T-only alphabet around a single flanked site, so
// the G/C-bearing default anchors can only occur where they were placed.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cctype>
#include <string>
#include <vector>

#include "tagc/core/barcode_reference.h"
#include "tagc/core/primer_context.h"
#include "tagc/core/sequence.h"
#include "tagc/core/tag_matcher.h"

namespace tagc::core::test {

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

/// @brief Generate an A/T string, either case.
[[nodiscard]] rc::Gen<std::string> weakBases(std::size_t minLen, std::size_t maxLen) {
    return rc::gen::mapcat(rc::gen::inRange(minLen, maxLen + 1), [](std::size_t length) {
        return rc::gen::container<std::string>(length, rc::gen::element('A', 'T', 'a', 't'));
    });
}

/// @brief Generate a barcode of valid length.
[[nodiscard]] rc::Gen<std::string> barcode() {
    return weakBases(8, 16);
}

/// @brief Generate a case transformation of a sequence.
[[nodiscard]] rc::Gen<std::string> recased(const std::string& sequence) {
    return rc::gen::map(rc::gen::container<std::vector<int>>(sequence.size(), rc::gen::inRange(0, 2)),
                        [sequence](const std::vector<int>& flags) {
                            std::string out = sequence;
                            for (std::size_t i = 0; i < out.size(); ++i) {
                                const auto c = static_cast<unsigned char>(out[i]);
                                out[i] = static_cast<char>(flags[i] ? std::toupper(c) : std::tolower(c));
                            }
                            return out;
                        });
}

}  // namespace gen

[[nodiscard]] std::string flankedRead(const std::string& left, const std::string& barcode,
                                      const std::string& right) {
    return left + "GTCAG" + barcode + "CCGCC" + right;
}

// =============================================================================
// Properties
// =============================================================================

/// Reads without any flanked region never resolve.
RC_GTEST_PROP(TagMatcherProperty, NoAnchorNeverResolves, ()) {
    const auto tag = *gen::barcode();
    const auto read = *gen::weakBases(0, 300);

    const auto reference = BarcodeReference::load({{"gene", tag, 0}});
    const TagMatcher matcher(reference, PrimerContext::defaults());

    RC_ASSERT(matcher.classify(read).outcome == MatchOutcome::kNoCandidate);
}

/// A single flanked reference barcode on the forward strand resolves to it.
RC_GTEST_PROP(TagMatcherProperty, ForwardSiteResolves, ()) {
    const auto tag = *gen::barcode();
    const auto read = flankedRead(*gen::weakBases(0, 40), tag, *gen::weakBases(0, 40));

    const auto reference = BarcodeReference::load({{"gene", tag, 0}});
    const TagMatcher matcher(reference, PrimerContext::defaults());

    const auto result = matcher.classify(read);
    RC_ASSERT(result.outcome == MatchOutcome::kResolved);
    RC_ASSERT(result.barcode == toLower(tag));
}

/// Strand symmetry: the reverse complement resolves to the same barcode.
RC_GTEST_PROP(TagMatcherProperty, ReverseComplementInvariance, ()) {
    const auto tag = *gen::barcode();
    const auto read = flankedRead(*gen::weakBases(0, 40), tag, *gen::weakBases(0, 40));

    const auto reference = BarcodeReference::load({{"gene", tag, 0}});
    const TagMatcher matcher(reference, PrimerContext::defaults());

    const auto forward = matcher.classify(read);
    const auto reverse = matcher.classify(reverseComplement(read));
    RC_ASSERT(forward.outcome == MatchOutcome::kResolved);
    RC_ASSERT(reverse.outcome == MatchOutcome::kResolved);
    RC_ASSERT(reverse.barcode == forward.barcode);
}

/// Recasing the read or the reference barcode never changes the outcome.
RC_GTEST_PROP(TagMatcherProperty, CaseInsensitivity, ()) {
    const auto tag = *gen::barcode();
    const auto read = flankedRead(*gen::weakBases(0, 40), tag, *gen::weakBases(0, 40));
    const auto recasedRead = *gen::recased(read);
    const auto recasedTag = *gen::recased(tag);

    const auto reference = BarcodeReference::load({{"gene", tag, 0}});
    const auto recasedReference = BarcodeReference::load({{"gene", recasedTag, 0}});
    const TagMatcher matcher(reference, PrimerContext::defaults());
    const TagMatcher recasedMatcher(recasedReference, PrimerContext::defaults());

    const auto expected = matcher.classify(read);
    for (const auto* m : {&matcher, &recasedMatcher}) {
        for (const auto* r : {&read, &recasedRead}) {
            const auto result = m->classify(*r);
            RC_ASSERT(result.outcome == expected.outcome);
            RC_ASSERT(result.barcode == expected.barcode);
        }
    }
}

/// Any span length outside [8,16] yields no candidate.
RC_GTEST_PROP(TagMatcherProperty, OutOfRangeSpansAreIgnored, ()) {
    const auto shortSpan = *gen::weakBases(1, 7);
    const auto longSpan = *gen::weakBases(17, 40);

    const auto reference = BarcodeReference::load({});
    const TagMatcher matcher(reference, PrimerContext::defaults());

    RC_ASSERT(matcher.extractCandidates(flankedRead("", shortSpan, "")).empty());
    RC_ASSERT(matcher.extractCandidates(flankedRead("", longSpan, "")).empty());
}

}  // namespace tagc::core::test
