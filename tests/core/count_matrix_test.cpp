// =============================================================================
// tag-counter - Count Matrix Tests
// =============================================================================

#include "tagc/core/count_matrix.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tagc::core {
namespace {

TEST(CountMatrixTest, IncrementAndCount) {
    CountMatrix matrix;
    matrix.increment("aaaaaaaa", "s1");
    matrix.increment("aaaaaaaa", "s1");
    matrix.increment("cccccccc", "s2", 5);

    EXPECT_EQ(matrix.count("aaaaaaaa", "s1"), 2u);
    EXPECT_EQ(matrix.count("aaaaaaaa", "s2"), 0u);
    EXPECT_EQ(matrix.count("cccccccc", "s2"), 5u);
    EXPECT_EQ(matrix.count("gggggggg", "s1"), 0u);
    EXPECT_EQ(matrix.total(), 7u);
}

TEST(CountMatrixTest, RegisteredSampleWithoutCounts) {
    CountMatrix matrix;
    matrix.registerSample("s2");
    matrix.increment("aaaaaaaa", "s1");

    EXPECT_EQ(matrix.samples(), (std::vector<std::string>{"s1", "s2"}));
    EXPECT_EQ(matrix.sampleTotal("s2"), 0u);
}

TEST(CountMatrixTest, NoMatchSortsFirst) {
    CountMatrix matrix;
    matrix.increment("tttttttt", "s1");
    matrix.increment("aaaaaaaa", "s1");
    matrix.increment(kNoMatchKey, "s1");
    matrix.increment("ccccccccc", "s1");

    EXPECT_EQ(matrix.orderedKeys(),
              (std::vector<std::string>{"no_match", "aaaaaaaa", "ccccccccc", "tttttttt"}));
}

TEST(CountMatrixTest, OrderedKeysWithoutNoMatch) {
    CountMatrix matrix;
    matrix.increment("zzzzzzzz", "s1");
    matrix.increment("pppppppp", "s1");

    EXPECT_EQ(matrix.orderedKeys(), (std::vector<std::string>{"pppppppp", "zzzzzzzz"}));
    EXPECT_FALSE(matrix.hasKey(kNoMatchKey));
}

TEST(CountMatrixTest, Merge) {
    CountMatrix a;
    a.increment("aaaaaaaa", "s1", 2);
    CountMatrix b;
    b.increment("aaaaaaaa", "s1", 3);
    b.increment(kNoMatchKey, "s2");
    b.registerSample("s3");

    a.merge(b);

    EXPECT_EQ(a.count("aaaaaaaa", "s1"), 5u);
    EXPECT_EQ(a.count(kNoMatchKey, "s2"), 1u);
    EXPECT_EQ(a.samples(), (std::vector<std::string>{"s1", "s2", "s3"}));
}

TEST(CountMatrixTest, EmptyMatrix) {
    CountMatrix matrix;
    EXPECT_TRUE(matrix.empty());
    EXPECT_TRUE(matrix.orderedKeys().empty());
    EXPECT_EQ(matrix.total(), 0u);
}

/// Sum over all keys of a sample equals the number of increments for that sample.
RC_GTEST_PROP(CountMatrixProperty, SampleTotalsMatchIncrements, ()) {
    const auto events = *rc::gen::container<std::vector<std::pair<int, int>>>(
        rc::gen::pair(rc::gen::inRange(0, 6), rc::gen::inRange(0, 3)));

    CountMatrix matrix;
    std::map<std::string, Count> expected;
    for (const auto& [keyIndex, sampleIndex] : events) {
        const std::string key =
            keyIndex == 0 ? std::string(kNoMatchKey) : std::string(8, static_cast<char>('a' + keyIndex));
        const std::string sample = "s" + std::to_string(sampleIndex);
        matrix.increment(key, sample);
        ++expected[sample];
    }

    for (const auto& [sample, count] : expected) {
        RC_ASSERT(matrix.sampleTotal(sample) == count);
    }
    RC_ASSERT(matrix.total() == events.size());
}

}  // namespace
}  // namespace tagc::core
