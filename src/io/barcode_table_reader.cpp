// =============================================================================
// tag-counter - Barcode Table Reader Implementation
// =============================================================================

#include "tagc/io/barcode_table_reader.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <fstream>
#include <optional>
#include <span>

#include <fmt/format.h>

#include "tagc/common/error.h"
#include "tagc/common/logger.h"

namespace tagc::io {

namespace {

constexpr std::array<std::string_view, 2> kGeneIdColumns = {"gene id", "gene_id"};
constexpr std::array<std::string_view, 3> kBarcodeColumns = {"tag", "Barcode", "barcode"};

[[nodiscard]] std::string_view trim(std::string_view value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

/// @brief Check whether a record has an unterminated quoted field.
[[nodiscard]] bool hasOpenQuote(std::string_view record) {
    bool inQuotes = false;
    for (char c : record) {
        if (c == '"') {
            inQuotes = !inQuotes;
        }
    }
    return inQuotes;
}

/// @brief Read one logical CSV record, joining physical lines inside quotes.
[[nodiscard]] bool readRecord(std::istream& input, std::string& record, std::uint64_t& lineNumber) {
    record.clear();
    std::string line;
    bool any = false;
    while (std::getline(input, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (any) {
            record.push_back('\n');
        }
        record += line;
        any = true;
        if (!hasOpenQuote(record)) {
            return true;
        }
    }
    return any;
}

/// @brief Index of the first header matching any alias, in alias order.
[[nodiscard]] std::vector<std::size_t> findColumns(const std::vector<std::string>& header,
                                                   std::span<const std::string_view> aliases) {
    std::vector<std::size_t> columns;
    for (auto alias : aliases) {
        auto it = std::find(header.begin(), header.end(), alias);
        if (it != header.end()) {
            columns.push_back(static_cast<std::size_t>(it - header.begin()));
        }
    }
    return columns;
}

/// @brief First non-empty value among the given columns.
[[nodiscard]] std::optional<std::string> firstValue(const std::vector<std::string>& fields,
                                                    const std::vector<std::size_t>& columns) {
    for (auto column : columns) {
        if (column < fields.size() && !fields[column].empty()) {
            return fields[column];
        }
    }
    return std::nullopt;
}

}  // namespace

std::vector<std::string> splitCsvRecord(std::string_view record) {
    std::vector<std::string> fields;
    std::string field;
    bool inQuotes = false;
    bool quoted = false;

    auto finishField = [&]() {
        fields.push_back(quoted ? field : std::string(trim(field)));
        field.clear();
        quoted = false;
    };

    for (std::size_t i = 0; i < record.size(); ++i) {
        const char c = record[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < record.size() && record[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field.push_back(c);
            }
        } else if (c == '"') {
            inQuotes = true;
            quoted = true;
            field.clear();
        } else if (c == ',') {
            finishField();
        } else if (!quoted) {
            field.push_back(c);
        }
    }

    if (inQuotes) {
        throw FormatError("unterminated quoted field in CSV record");
    }
    finishField();
    return fields;
}

std::vector<core::BarcodeRow> readBarcodeTable(std::istream& input, std::string_view sourceName) {
    std::uint64_t lineNumber = 0;
    std::string record;

    if (!readRecord(input, record, lineNumber)) {
        throw ConfigError(fmt::format("barcode table {} is empty", sourceName));
    }

    const auto header = splitCsvRecord(record);
    const auto geneColumns = findColumns(header, kGeneIdColumns);
    const auto barcodeColumns = findColumns(header, kBarcodeColumns);

    if (geneColumns.empty()) {
        throw ConfigError(fmt::format("barcode table {} has no 'gene id' or 'gene_id' column",
                                      sourceName));
    }
    if (barcodeColumns.empty()) {
        TAGC_LOG_WARNING("barcode table {} has no 'tag', 'Barcode' or 'barcode' column",
                         std::string(sourceName));
    }

    std::vector<core::BarcodeRow> rows;
    while (true) {
        const std::uint64_t recordLine = lineNumber + 1;
        if (!readRecord(input, record, lineNumber)) {
            break;
        }
        if (trim(record).empty()) {
            continue;
        }

        std::vector<std::string> fields;
        try {
            fields = splitCsvRecord(record);
        } catch (const FormatError& e) {
            throw FormatError(e.message(),
                              ErrorContext(std::string(sourceName)).withLine(recordLine));
        }

        core::BarcodeRow row;
        row.geneId = firstValue(fields, geneColumns).value_or(std::string{});
        row.barcode = firstValue(fields, barcodeColumns);
        row.lineNumber = recordLine;
        rows.push_back(std::move(row));
    }

    TAGC_LOG_DEBUG("Read {} rows from barcode table {}", rows.size(), std::string(sourceName));
    return rows;
}

std::vector<core::BarcodeRow> readBarcodeTable(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw IOError(fmt::format("could not open {}", path.string()));
    }
    return readBarcodeTable(input, path.string());
}

}  // namespace tagc::io
