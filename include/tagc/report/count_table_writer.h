// =============================================================================
// tag-counter - Count Table
// =============================================================================
// Turns a CountMatrix into the final barcode x sample table and writes it as
// CSV.
//
// Row layout:
// - no_match first (empty gene), then barcode keys ascending
// - per-gene mode (default): keys sharing a gene are merged into one row,
//   barcode cell "key1;key2", placed at its smallest key
// - per-tag mode: one row per barcode key
//
// Output example:
//   "barcode","gene",sample1,sample2
//   "no_match","",3,0
//   "aaaaaaaa","geneA",1,4
// =============================================================================

#ifndef TAGC_REPORT_COUNT_TABLE_WRITER_H
#define TAGC_REPORT_COUNT_TABLE_WRITER_H

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "tagc/common/types.h"
#include "tagc/core/barcode_reference.h"
#include "tagc/core/count_matrix.h"

namespace tagc::report {

/// @brief Options controlling row grouping.
struct ReportOptions {
    /// @brief One row per barcode instead of one row per gene.
    bool byTag = false;
};

/// @brief One output row.
struct CountRow {
    /// @brief Barcode key, or ';'-joined keys of a merged gene row.
    std::string barcode;

    /// @brief Gene id, empty for no_match.
    std::string gene;

    /// @brief Counts, one per sample in CountTable::samples() order.
    std::vector<Count> counts;

    /// @brief Sum of all counts in the row.
    [[nodiscard]] Count total() const noexcept;
};

// =============================================================================
// CountTable Class
// =============================================================================

/// @brief Materialized report table.
class CountTable {
public:
    CountTable() = default;

    /// @brief Build the table from counts and the barcode reference.
    [[nodiscard]] static CountTable build(const core::CountMatrix& matrix,
                                          const core::BarcodeReference& reference,
                                          const ReportOptions& options = {});

    [[nodiscard]] const std::vector<std::string>& samples() const noexcept { return samples_; }
    [[nodiscard]] const std::vector<CountRow>& rows() const noexcept { return rows_; }
    [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

    /// @brief Sum of every cell.
    [[nodiscard]] Count total() const noexcept;

private:
    std::vector<std::string> samples_;
    std::vector<CountRow> rows_;
};

// =============================================================================
// CSV Output
// =============================================================================

/// @brief Render the table as CSV text.
[[nodiscard]] std::string formatCsv(const CountTable& table);

/// @brief Write the table as CSV to a stream.
/// @throws IOError if the stream fails.
void writeCsv(const CountTable& table, std::ostream& output);

/// @brief Write the table as CSV to a file (truncated).
/// @throws IOError if the file cannot be written.
void writeCsv(const CountTable& table, const std::filesystem::path& path);

}  // namespace tagc::report

#endif  // TAGC_REPORT_COUNT_TABLE_WRITER_H
