// =============================================================================
// tag-counter - Barcode Reference Tests
// =============================================================================

#include "tagc/core/barcode_reference.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "tagc/common/error.h"

namespace tagc::core {
namespace {

[[nodiscard]] BarcodeRow row(std::string gene, std::optional<std::string> barcode,
                             std::uint64_t line = 0) {
    return BarcodeRow{std::move(gene), std::move(barcode), line};
}

TEST(BarcodeReferenceTest, LoadsAndLowercasesKeys) {
    const auto reference = BarcodeReference::load({row("PBANKA_000010", "TTCGCCGGGCC"),
                                                   row("PBANKA_000030", "caggcaatcgg")});

    EXPECT_EQ(reference.size(), 2u);
    ASSERT_EQ(reference.entries().count("ttcgccgggcc"), 1u);
    EXPECT_EQ(reference.entries().at("ttcgccgggcc"), "PBANKA_000010");
}

TEST(BarcodeReferenceTest, LookupIsCaseInsensitive) {
    const auto reference = BarcodeReference::load({row("geneA", "AcGtAcGt")});

    ASSERT_NE(reference.geneFor("ACGTACGT"), nullptr);
    EXPECT_EQ(*reference.geneFor("acgtacgt"), "geneA");
    EXPECT_TRUE(reference.contains("aCgTaCgT"));
    EXPECT_NE(reference.geneForKey("acgtacgt"), nullptr);
    EXPECT_EQ(reference.geneForKey("ACGTACGT"), nullptr);
    EXPECT_FALSE(reference.contains("acgtacga"));
}

TEST(BarcodeReferenceTest, NoneMarkerIsSkipped) {
    const auto reference = BarcodeReference::load(
        {row("geneA", "none"), row("geneB", "NONE"), row("geneC", "aaaaaaaa")});

    EXPECT_EQ(reference.size(), 1u);
    EXPECT_EQ(reference.skippedRows(), 2u);
    EXPECT_FALSE(reference.contains("none"));
}

TEST(BarcodeReferenceTest, MissingGeneIsFatal) {
    EXPECT_THROW((void)BarcodeReference::load({row("", "aaaaaaaa", 2)}), ConfigError);
}

TEST(BarcodeReferenceTest, MissingBarcodeIsFatalByDefault) {
    EXPECT_THROW((void)BarcodeReference::load({row("geneA", std::nullopt)}), ConfigError);
    EXPECT_THROW((void)BarcodeReference::load({row("geneA", "")}), ConfigError);
}

TEST(BarcodeReferenceTest, MissingBarcodeToleratedWhenIgnored) {
    const auto reference = BarcodeReference::load(
        {row("geneA", std::nullopt), row("geneB", ""), row("geneC", "cccccccc")},
        ReferenceOptions{.ignoreMissingTag = true});

    EXPECT_EQ(reference.size(), 1u);
    EXPECT_EQ(reference.skippedRows(), 2u);
}

TEST(BarcodeReferenceTest, LengthBounds) {
    EXPECT_NO_THROW((void)BarcodeReference::load({row("g8", std::string(8, 'a'))}));
    EXPECT_NO_THROW((void)BarcodeReference::load({row("g16", std::string(16, 'a'))}));
    EXPECT_THROW((void)BarcodeReference::load({row("g7", std::string(7, 'a'))}), ConfigError);
    EXPECT_THROW((void)BarcodeReference::load({row("g17", std::string(17, 'a'))}), ConfigError);
}

TEST(BarcodeReferenceTest, LengthErrorReportsLine) {
    try {
        (void)BarcodeReference::load({row("geneA", "acgt", 12)});
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        ASSERT_TRUE(e.context().has_value());
        ASSERT_TRUE(e.context()->lineNumber.has_value());
        EXPECT_EQ(*e.context()->lineNumber, 12u);
        EXPECT_NE(e.message().find("acgt"), std::string::npos);
    }
}

TEST(BarcodeReferenceTest, DuplicateKeyLastWins) {
    const auto reference = BarcodeReference::load(
        {row("geneA", "aaaaaaaa"), row("geneB", "AAAAAAAA")});

    EXPECT_EQ(reference.size(), 1u);
    EXPECT_EQ(reference.duplicateRows(), 1u);
    ASSERT_NE(reference.geneFor("aaaaaaaa"), nullptr);
    EXPECT_EQ(*reference.geneFor("aaaaaaaa"), "geneB");
}

TEST(BarcodeReferenceTest, DuplicateKeyIsDeterministic) {
    const std::vector<BarcodeRow> rows = {row("geneA", "aaaaaaaa"), row("geneB", "aaaaaaaa"),
                                          row("geneC", "aaaaaaaa")};
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(*BarcodeReference::load(rows).geneFor("aaaaaaaa"), "geneC");
    }
}

TEST(BarcodeReferenceTest, EmptyInputGivesEmptyReference) {
    const auto reference = BarcodeReference::load({});
    EXPECT_TRUE(reference.empty());
}

}  // namespace
}  // namespace tagc::core
