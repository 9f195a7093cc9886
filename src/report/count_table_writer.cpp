// =============================================================================
// tag-counter - Count Table Implementation
// =============================================================================

#include "tagc/report/count_table_writer.h"

#include <fstream>
#include <iterator>
#include <map>
#include <numeric>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "tagc/common/error.h"
#include "tagc/common/logger.h"

namespace tagc::report {

namespace {

constexpr char kMergedKeySeparator = ';';

[[nodiscard]] CountRow makeRow(const core::CountMatrix& matrix, const std::string& key,
                               std::string gene, const std::vector<std::string>& samples) {
    CountRow row;
    row.barcode = key;
    row.gene = std::move(gene);
    row.counts.reserve(samples.size());
    for (const auto& sample : samples) {
        row.counts.push_back(matrix.count(key, sample));
    }
    return row;
}

}  // namespace

Count CountRow::total() const noexcept {
    return std::accumulate(counts.begin(), counts.end(), Count{0});
}

CountTable CountTable::build(const core::CountMatrix& matrix,
                             const core::BarcodeReference& reference,
                             const ReportOptions& options) {
    CountTable table;
    table.samples_ = matrix.samples();

    // Row index of the first (smallest) key seen for each gene
    std::map<std::string, std::size_t, std::less<>> geneRows;

    for (const auto& key : matrix.orderedKeys()) {
        if (key == kNoMatchKey) {
            table.rows_.push_back(makeRow(matrix, key, std::string{}, table.samples_));
            continue;
        }

        const std::string* gene = reference.geneForKey(key);
        std::string geneId = gene != nullptr ? *gene : std::string{};
        if (gene == nullptr) {
            TAGC_LOG_WARNING("barcode {} has counts but no gene in the reference", key);
        }

        if (options.byTag || geneId.empty()) {
            table.rows_.push_back(makeRow(matrix, key, std::move(geneId), table.samples_));
            continue;
        }

        auto it = geneRows.find(geneId);
        if (it == geneRows.end()) {
            geneRows.emplace(geneId, table.rows_.size());
            table.rows_.push_back(makeRow(matrix, key, std::move(geneId), table.samples_));
            continue;
        }

        auto& row = table.rows_[it->second];
        row.barcode.push_back(kMergedKeySeparator);
        row.barcode += key;
        for (std::size_t i = 0; i < table.samples_.size(); ++i) {
            row.counts[i] += matrix.count(key, table.samples_[i]);
        }
    }

    return table;
}

Count CountTable::total() const noexcept {
    Count sum = 0;
    for (const auto& row : rows_) {
        sum += row.total();
    }
    return sum;
}

std::string formatCsv(const CountTable& table) {
    fmt::memory_buffer out;

    fmt::format_to(std::back_inserter(out), "\"barcode\",\"gene\",{}\n",
                   fmt::join(table.samples(), ","));

    for (const auto& row : table.rows()) {
        fmt::format_to(std::back_inserter(out), "\"{}\",\"{}\"", row.barcode, row.gene);
        for (auto count : row.counts) {
            fmt::format_to(std::back_inserter(out), ",{}", count);
        }
        out.push_back('\n');
    }

    return fmt::to_string(out);
}

void writeCsv(const CountTable& table, std::ostream& output) {
    const std::string text = formatCsv(table);
    output.write(text.data(), static_cast<std::streamsize>(text.size()));
    output.flush();
    if (!output) {
        throw IOError("failed to write count table");
    }
}

void writeCsv(const CountTable& table, const std::filesystem::path& path) {
    std::ofstream output(path, std::ios::out | std::ios::trunc);
    if (!output.is_open()) {
        throw IOError(fmt::format("could not open {} for writing", path.string()));
    }
    try {
        writeCsv(table, output);
    } catch (const IOError& e) {
        throw IOError(e.message(), ErrorContext(path.string()));
    }
    TAGC_LOG_DEBUG("Wrote {} rows to {}", table.rows().size(), path.string());
}

}  // namespace tagc::report
