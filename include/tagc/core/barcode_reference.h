// =============================================================================
// tag-counter - Barcode Reference
// =============================================================================
// In-memory lookup of known barcode sequences to gene identifiers.
//
// This module provides:
// - BarcodeRow: one logical row of the barcode table
// - ReferenceOptions: loading switches
// - BarcodeReference: validated, lowercase-keyed barcode -> gene map
//
// Usage:
//   auto reference = BarcodeReference::load(rows, {.ignoreMissingTag = true});
//   if (const auto* gene = reference.geneFor("ACGTACGT")) { ... }
// =============================================================================

#ifndef TAGC_CORE_BARCODE_REFERENCE_H
#define TAGC_CORE_BARCODE_REFERENCE_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tagc::core {

// =============================================================================
// Barcode Row
// =============================================================================

/// @brief One row of the barcode table as supplied by the table reader.
struct BarcodeRow {
    /// @brief Gene identifier. Empty means absent.
    std::string geneId;

    /// @brief Barcode sequence, nullopt (or empty) when the row has none.
    std::optional<std::string> barcode;

    /// @brief Source line number (1-based), 0 when unknown.
    std::uint64_t lineNumber = 0;
};

// =============================================================================
// Reference Options
// =============================================================================

/// @brief Options controlling reference loading.
struct ReferenceOptions {
    /// @brief Skip rows without a barcode instead of failing.
    bool ignoreMissingTag = false;
};

// =============================================================================
// BarcodeReference Class
// =============================================================================

/// @brief Immutable barcode -> gene lookup.
///
/// Keys are lowercase. When the same barcode appears more than once the last
/// row wins; a warning is logged if the gene differs.
class BarcodeReference {
public:
    /// @brief Ordered barcode -> gene mapping.
    using Map = std::map<std::string, std::string, std::less<>>;

    BarcodeReference() = default;

    /// @brief Validate rows and build the reference.
    /// @throws ConfigError on a missing gene id, a missing barcode (unless
    ///         tolerated) or a barcode outside [8,16].
    [[nodiscard]] static BarcodeReference load(const std::vector<BarcodeRow>& rows,
                                               const ReferenceOptions& options = {});

    /// @brief Gene for a barcode (any case), nullptr if unknown.
    [[nodiscard]] const std::string* geneFor(std::string_view barcode) const;

    /// @brief Gene for an already lowercase key, nullptr if unknown.
    [[nodiscard]] const std::string* geneForKey(std::string_view lowercaseKey) const;

    /// @brief Check whether a barcode (any case) is known.
    [[nodiscard]] bool contains(std::string_view barcode) const { return geneFor(barcode) != nullptr; }

    [[nodiscard]] std::size_t size() const noexcept { return barcodes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return barcodes_.empty(); }

    /// @brief Number of rows skipped because they carried no tag.
    [[nodiscard]] std::size_t skippedRows() const noexcept { return skippedRows_; }

    /// @brief Number of rows that replaced an earlier row with the same barcode.
    [[nodiscard]] std::size_t duplicateRows() const noexcept { return duplicateRows_; }

    /// @brief Underlying mapping.
    [[nodiscard]] const Map& entries() const noexcept { return barcodes_; }

private:
    Map barcodes_;
    std::size_t skippedRows_ = 0;
    std::size_t duplicateRows_ = 0;
};

}  // namespace tagc::core

#endif  // TAGC_CORE_BARCODE_REFERENCE_H
