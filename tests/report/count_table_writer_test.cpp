// =============================================================================
// tag-counter - Count Table Tests
// =============================================================================

#include "tagc/report/count_table_writer.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "tagc/common/error.h"
#include "test_util.h"

namespace tagc::report {
namespace {

using core::BarcodeReference;
using core::CountMatrix;

class CountTableTest : public ::testing::Test {
protected:
    CountTableTest()
        : reference_(BarcodeReference::load({{"geneA", "aaaaaaaa", 0},
                                             {"geneB", "cccccccc", 0},
                                             {"geneA", "gggggggg", 0},
                                             {"geneC", "tttttttt", 0}})) {
        matrix_.increment(kNoMatchKey, "s1", 3);
        matrix_.increment("aaaaaaaa", "s1", 1);
        matrix_.increment("gggggggg", "s1", 2);
        matrix_.increment("gggggggg", "s2", 5);
        matrix_.increment("cccccccc", "s2", 4);
    }

    BarcodeReference reference_;
    CountMatrix matrix_;
};

TEST(CountTableExampleTest, SingleBarcodeAndJunkReads) {
    const auto reference = BarcodeReference::load({{"geneA", "aaaaaaaa", 0}});
    CountMatrix matrix;
    matrix.increment("aaaaaaaa", "s1");
    matrix.increment(kNoMatchKey, "s1", 3);

    const auto table = CountTable::build(matrix, reference);
    EXPECT_EQ(formatCsv(table),
              "\"barcode\",\"gene\",s1\n"
              "\"no_match\",\"\",3\n"
              "\"aaaaaaaa\",\"geneA\",1\n");
}

TEST_F(CountTableTest, PerTagRows) {
    const auto table = CountTable::build(matrix_, reference_, ReportOptions{.byTag = true});

    EXPECT_EQ(table.samples(), (std::vector<std::string>{"s1", "s2"}));
    EXPECT_EQ(formatCsv(table),
              "\"barcode\",\"gene\",s1,s2\n"
              "\"no_match\",\"\",3,0\n"
              "\"aaaaaaaa\",\"geneA\",1,0\n"
              "\"cccccccc\",\"geneB\",0,4\n"
              "\"gggggggg\",\"geneA\",2,5\n");
}

TEST_F(CountTableTest, PerGeneRowsMergeBarcodes) {
    const auto table = CountTable::build(matrix_, reference_);

    ASSERT_EQ(table.rows().size(), 3u);
    EXPECT_EQ(table.rows()[1].barcode, "aaaaaaaa;gggggggg");
    EXPECT_EQ(table.rows()[1].counts, (std::vector<Count>{3, 5}));
    EXPECT_EQ(formatCsv(table),
              "\"barcode\",\"gene\",s1,s2\n"
              "\"no_match\",\"\",3,0\n"
              "\"aaaaaaaa;gggggggg\",\"geneA\",3,5\n"
              "\"cccccccc\",\"geneB\",0,4\n");
}

TEST_F(CountTableTest, GroupingPreservesTotals) {
    const auto perGene = CountTable::build(matrix_, reference_);
    const auto perTag = CountTable::build(matrix_, reference_, ReportOptions{.byTag = true});

    EXPECT_EQ(perGene.total(), matrix_.total());
    EXPECT_EQ(perTag.total(), matrix_.total());
}

TEST_F(CountTableTest, OnlyCountedBarcodesAppear) {
    const auto table = CountTable::build(matrix_, reference_, ReportOptions{.byTag = true});
    for (const auto& row : table.rows()) {
        EXPECT_NE(row.barcode, "tttttttt");
    }
}

TEST_F(CountTableTest, OutputIsIdempotent) {
    const auto first = formatCsv(CountTable::build(matrix_, reference_));
    const auto second = formatCsv(CountTable::build(matrix_, reference_));
    EXPECT_EQ(first, second);
}

TEST(CountTableEdgeTest, NoMatchRowOnlyWhenUnresolvedReadsExist) {
    const auto reference = BarcodeReference::load({{"geneA", "aaaaaaaa", 0}});
    CountMatrix matrix;
    matrix.increment("aaaaaaaa", "s1", 2);

    EXPECT_EQ(formatCsv(CountTable::build(matrix, reference)),
              "\"barcode\",\"gene\",s1\n"
              "\"aaaaaaaa\",\"geneA\",2\n");
}

TEST(CountTableEdgeTest, SamplesWithoutReadsGetZeroColumns) {
    const auto reference = BarcodeReference::load({});
    CountMatrix matrix;
    matrix.registerSample("s1");
    matrix.registerSample("s2");

    const auto table = CountTable::build(matrix, reference);
    EXPECT_TRUE(table.empty());
    EXPECT_EQ(formatCsv(table), "\"barcode\",\"gene\",s1,s2\n");
}

TEST_F(CountTableTest, WritesToStreamAndFile) {
    const auto table = CountTable::build(matrix_, reference_);

    std::ostringstream out;
    writeCsv(table, out);
    EXPECT_EQ(out.str(), formatCsv(table));

    tagc::test::TempDir dir;
    writeCsv(table, dir / "counts.csv");
    EXPECT_EQ(tagc::test::readFile(dir / "counts.csv"), formatCsv(table));
}

TEST_F(CountTableTest, UnwritableFileIsAnIOError) {
    tagc::test::TempDir dir;
    const auto table = CountTable::build(matrix_, reference_);
    EXPECT_THROW(writeCsv(table, dir / "missing" / "counts.csv"), IOError);
}

}  // namespace
}  // namespace tagc::report
