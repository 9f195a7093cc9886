// =============================================================================
// tag-counter - Barcode Reference Implementation
// =============================================================================

#include "tagc/core/barcode_reference.h"

#include <fmt/format.h>

#include "tagc/common/error.h"
#include "tagc/common/logger.h"
#include "tagc/common/types.h"
#include "tagc/core/sequence.h"

namespace tagc::core {

namespace {

ErrorContext rowContext(const BarcodeRow& row) {
    ErrorContext context;
    if (row.lineNumber > 0) {
        context.withLine(row.lineNumber);
    }
    return context;
}

}  // namespace

BarcodeReference BarcodeReference::load(const std::vector<BarcodeRow>& rows,
                                        const ReferenceOptions& options) {
    BarcodeReference reference;

    for (const auto& row : rows) {
        if (row.geneId.empty()) {
            throw ConfigError("could not read gene id", rowContext(row));
        }

        if (!row.barcode.has_value() || row.barcode->empty()) {
            if (!options.ignoreMissingTag) {
                throw ConfigError(fmt::format("could not read barcode tag for gene {}", row.geneId),
                                  rowContext(row));
            }
            ++reference.skippedRows_;
            continue;
        }

        const std::string& tag = *row.barcode;
        if (equalsIgnoreCase(tag, kNoTagMarker)) {
            ++reference.skippedRows_;
            continue;
        }

        if (tag.size() < kMinBarcodeLength || tag.size() > kMaxBarcodeLength) {
            throw ConfigError(fmt::format("found a barcode outside allowed length range ({}-{}): "
                                          "{}, length: {}",
                                          kMinBarcodeLength, kMaxBarcodeLength, tag, tag.size()),
                              rowContext(row));
        }

        std::string key = toLower(tag);
        auto [it, inserted] = reference.barcodes_.try_emplace(key, row.geneId);
        if (!inserted) {
            ++reference.duplicateRows_;
            if (it->second != row.geneId) {
                TAGC_LOG_WARNING("barcode {} maps to {} and {}; keeping {}", key, it->second,
                                 row.geneId, row.geneId);
            }
            it->second = row.geneId;
        }
    }

    return reference;
}

const std::string* BarcodeReference::geneFor(std::string_view barcode) const {
    return geneForKey(toLower(barcode));
}

const std::string* BarcodeReference::geneForKey(std::string_view lowercaseKey) const {
    auto it = barcodes_.find(lowercaseKey);
    return it != barcodes_.end() ? &it->second : nullptr;
}

}  // namespace tagc::core
