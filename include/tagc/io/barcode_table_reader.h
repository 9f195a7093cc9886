// =============================================================================
// tag-counter - Barcode Table Reader
// =============================================================================
// Reads the gene -> barcode table (CSV with a header row).
//
// Recognised headers:
// - gene identifier: "gene id", "gene_id"
// - barcode: "tag", "Barcode", "barcode" (first non-empty value wins)
//
// Format example:
//   gene_id,barcode
//   PBANKA_000010,ttcgccgggcc
//   PBANKA_000030,caggcaatcgg
// =============================================================================

#ifndef TAGC_IO_BARCODE_TABLE_READER_H
#define TAGC_IO_BARCODE_TABLE_READER_H

#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "tagc/core/barcode_reference.h"

namespace tagc::io {

/// @brief Split one CSV record into fields.
/// @note Double quotes delimit fields, "" is an escaped quote. Unquoted
///       fields are trimmed of surrounding spaces and tabs.
[[nodiscard]] std::vector<std::string> splitCsvRecord(std::string_view record);

/// @brief Parse a barcode table from a stream.
/// @param input CSV text.
/// @param sourceName Name used in error messages.
/// @throws ConfigError if the header lacks a gene id column.
/// @throws FormatError on an unterminated quoted field.
[[nodiscard]] std::vector<core::BarcodeRow> readBarcodeTable(std::istream& input,
                                                             std::string_view sourceName = "<stream>");

/// @brief Parse a barcode table file.
/// @throws IOError if the file cannot be opened.
[[nodiscard]] std::vector<core::BarcodeRow> readBarcodeTable(const std::filesystem::path& path);

}  // namespace tagc::io

#endif  // TAGC_IO_BARCODE_TABLE_READER_H
