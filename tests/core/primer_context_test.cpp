// =============================================================================
// tag-counter - Primer Context Tests
// =============================================================================

#include "tagc/core/primer_context.h"

#include <gtest/gtest.h>

#include "tagc/common/error.h"
#include "tagc/common/types.h"

namespace tagc::core {
namespace {

TEST(PrimerContextTest, DefaultAnchors) {
    const auto context = PrimerContext::defaults();
    EXPECT_EQ(context.fivePrimeAnchor(), "gtcag");
    EXPECT_EQ(context.threePrimeAnchor(), "ccgcc");
    EXPECT_EQ(context.fivePrimeAnchorRc(), "ctgac");
    EXPECT_EQ(context.threePrimeAnchorRc(), "ggcgg");
}

TEST(PrimerContextTest, UsesBasesAdjacentToTheBarcode) {
    PrimerContext context("TTTTTAACCG", "gGaTcTTTTT");
    EXPECT_EQ(context.fivePrimeAnchor(), "aaccg");
    EXPECT_EQ(context.threePrimeAnchor(), "ggatc");
    EXPECT_EQ(context.fivePrimeAnchorRc(), "cggtt");
    EXPECT_EQ(context.threePrimeAnchorRc(), "gatcc");
}

TEST(PrimerContextTest, ExactlyFiveBasesIsEnough) {
    EXPECT_NO_THROW(PrimerContext("ACGTA", "CCGCC"));
}

TEST(PrimerContextTest, ShortContextIsAConfigError) {
    EXPECT_THROW(PrimerContext("ACGT", kDefaultThreePrimeContext), ConfigError);
    EXPECT_THROW(PrimerContext(kDefaultFivePrimeContext, ""), ConfigError);
}

}  // namespace
}  // namespace tagc::core
