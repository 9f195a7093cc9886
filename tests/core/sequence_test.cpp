// =============================================================================
// tag-counter - Sequence Utility Tests
// =============================================================================

#include "tagc/core/sequence.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <string>

namespace tagc::core {
namespace {

TEST(SequenceTest, ReverseComplement) {
    EXPECT_EQ(reverseComplement("ACGT"), "ACGT");
    EXPECT_EQ(reverseComplement("AACCG"), "CGGTT");
    EXPECT_EQ(reverseComplement(""), "");
}

TEST(SequenceTest, ReverseComplementKeepsCase) {
    EXPECT_EQ(reverseComplement("gtcag"), "ctgac");
    EXPECT_EQ(reverseComplement("aCgT"), "AcGt");
}

TEST(SequenceTest, ReverseComplementLeavesOtherCharactersAlone) {
    EXPECT_EQ(reverseComplement("ANNT"), "ANNT");
    EXPECT_EQ(reverseComplement("A-C"), "G-T");
}

TEST(SequenceTest, ToLower) {
    EXPECT_EQ(toLower("AcGtN"), "acgtn");
    EXPECT_EQ(toLowerAscii('G'), 'g');
}

TEST(SequenceTest, EqualsIgnoreCase) {
    EXPECT_TRUE(equalsIgnoreCase("None", "none"));
    EXPECT_TRUE(equalsIgnoreCase("", ""));
    EXPECT_FALSE(equalsIgnoreCase("nonex", "none"));
    EXPECT_FALSE(equalsIgnoreCase("nane", "none"));
}

RC_GTEST_PROP(SequenceProperty, ReverseComplementIsAnInvolution, ()) {
    const auto sequence = *rc::gen::container<std::string>(
        rc::gen::element('A', 'C', 'G', 'T', 'a', 'c', 'g', 't', 'N'));
    RC_ASSERT(reverseComplement(reverseComplement(sequence)) == sequence);
}

}  // namespace
}  // namespace tagc::core
