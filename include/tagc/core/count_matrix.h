// =============================================================================
// tag-counter - Count Matrix
// =============================================================================
// Accumulator of read counts keyed by (barcode key, sample).
//
// Keys are lowercase barcodes or the `no_match` sentinel. Samples are
// registered explicitly so that a sample without any read still owns a
// column. The matrix is built incrementally and read once for reporting.
// =============================================================================

#ifndef TAGC_CORE_COUNT_MATRIX_H
#define TAGC_CORE_COUNT_MATRIX_H

#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "tagc/common/types.h"

namespace tagc::core {

/// @brief Sparse (barcode key x sample) count accumulator.
class CountMatrix {
public:
    using SampleCounts = std::map<std::string, Count, std::less<>>;
    using Rows = std::map<std::string, SampleCounts, std::less<>>;

    /// @brief Make a sample known, even if it never receives a count.
    void registerSample(std::string_view sample);

    /// @brief Add @p amount to cell (key, sample); registers the sample.
    void increment(std::string_view key, std::string_view sample, Count amount = 1);

    /// @brief Sum another matrix into this one.
    void merge(const CountMatrix& other);

    /// @brief Count for a cell, 0 if absent.
    [[nodiscard]] Count count(std::string_view key, std::string_view sample) const;

    /// @brief Sum over all keys for a sample (including no_match).
    [[nodiscard]] Count sampleTotal(std::string_view sample) const;

    /// @brief Sum over all cells.
    [[nodiscard]] Count total() const;

    [[nodiscard]] bool hasKey(std::string_view key) const { return rows_.find(key) != rows_.end(); }

    /// @brief Samples in ascending order.
    [[nodiscard]] std::vector<std::string> samples() const;

    /// @brief Keys in report order: no_match first, then ascending.
    [[nodiscard]] std::vector<std::string> orderedKeys() const;

    [[nodiscard]] const Rows& rows() const noexcept { return rows_; }

    [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

private:
    Rows rows_;
    std::set<std::string, std::less<>> samples_;
};

}  // namespace tagc::core

#endif  // TAGC_CORE_COUNT_MATRIX_H
