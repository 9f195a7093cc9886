// =============================================================================
// tag-counter - FASTQ Parser
// =============================================================================
// Streaming 4-line FASTQ parser.
//
// This module provides:
// - FastqRecord: the four lines of a record, kept verbatim
// - FastqParser: record-by-record and chunked reading, plain or gzip input
// - Structural validation of records
//
// Usage:
//   FastqParser parser("/path/to/sample1.fastq.gz");
//   parser.open();
//   while (auto chunk = parser.readChunk(10000)) {
//       for (const auto& record : *chunk) {
//           // process record...
//       }
//   }
// =============================================================================

#ifndef TAGC_IO_FASTQ_PARSER_H
#define TAGC_IO_FASTQ_PARSER_H

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tagc/common/error.h"

namespace tagc::io {

// =============================================================================
// FASTQ Record
// =============================================================================

/// @brief A single FASTQ record.
/// @note All four lines are kept exactly as read (minus the line terminator)
///       so that a record can be written back unchanged.
struct FastqRecord {
    /// @brief Identifier line, including the leading '@'.
    std::string header;

    /// @brief Read sequence.
    std::string sequence;

    /// @brief Separator line, including the leading '+'.
    std::string separator;

    /// @brief Quality string (never interpreted).
    std::string quality;

    /// @brief Get the read length.
    [[nodiscard]] std::size_t length() const noexcept { return sequence.size(); }

    void clear() noexcept {
        header.clear();
        sequence.clear();
        separator.clear();
        quality.clear();
    }
};

// =============================================================================
// Parser Statistics
// =============================================================================

/// @brief Statistics collected during parsing.
struct ParserStats {
    std::uint64_t totalRecords = 0;
    std::uint64_t totalBases = 0;
    std::uint64_t minLength = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t maxLength = 0;

    void update(const FastqRecord& record) noexcept {
        ++totalRecords;
        auto len = static_cast<std::uint64_t>(record.length());
        totalBases += len;
        minLength = std::min(minLength, len);
        maxLength = std::max(maxLength, len);
    }

    [[nodiscard]] double averageLength() const noexcept {
        return totalRecords > 0 ? static_cast<double>(totalBases) / totalRecords : 0.0;
    }

    void reset() noexcept { *this = ParserStats{}; }
};

// =============================================================================
// Parser Options
// =============================================================================

/// @brief Configuration options for the FASTQ parser.
struct ParserOptions {
    /// @brief Require '@' header and '+' separator lines.
    /// @note When off, any four lines form a record; truncation is still an error.
    bool validateStructure = true;

    /// @brief Require quality length to equal sequence length.
    bool validateQualityLength = false;

    /// @brief Strip a trailing '\r' (CRLF input).
    bool stripCarriageReturn = true;

    /// @brief Whether to collect statistics.
    bool collectStats = true;
};

// =============================================================================
// FastqParser Class
// =============================================================================

/// @brief Streaming FASTQ parser.
///
/// Thread Safety:
/// - Not thread-safe; use one parser per input.
class FastqParser {
public:
    /// @brief Chunk of parsed records.
    using Chunk = std::vector<FastqRecord>;

    /// @brief Construct a parser for a file (plain or gzip compressed).
    explicit FastqParser(std::filesystem::path filePath, ParserOptions options = {});

    /// @brief Construct a parser from an already open input stream.
    explicit FastqParser(std::unique_ptr<std::istream> stream, ParserOptions options = {});

    ~FastqParser();

    // Non-copyable, movable
    FastqParser(const FastqParser&) = delete;
    FastqParser& operator=(const FastqParser&) = delete;
    FastqParser(FastqParser&&) noexcept;
    FastqParser& operator=(FastqParser&&) noexcept;

    /// @brief Open the file for parsing.
    /// @throws IOError if the file cannot be opened.
    void open();

    /// @brief Close the parser.
    void close() noexcept;

    [[nodiscard]] bool isOpen() const noexcept { return isOpen_; }
    [[nodiscard]] bool eof() const noexcept { return eof_; }

    /// @brief Read a single record.
    /// @return The parsed record, or nullopt at EOF.
    /// @throws FormatError on a malformed or truncated record.
    [[nodiscard]] std::optional<FastqRecord> readRecord();

    /// @brief Read up to @p maxRecords records.
    /// @return Records read, or nullopt at EOF.
    /// @throws FormatError on a malformed or truncated record.
    [[nodiscard]] std::optional<Chunk> readChunk(std::size_t maxRecords);

    [[nodiscard]] const ParserStats& stats() const noexcept { return stats_; }
    [[nodiscard]] std::uint64_t lineNumber() const noexcept { return lineNumber_; }
    [[nodiscard]] std::uint64_t recordNumber() const noexcept { return recordNumber_; }
    [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return filePath_; }

private:
    [[nodiscard]] bool readLine(std::string& line);
    [[nodiscard]] bool parseRecord(FastqRecord& record);
    [[noreturn]] void fail(std::string message) const;

    std::filesystem::path filePath_;
    ParserOptions options_;
    std::unique_ptr<std::istream> stream_;
    bool isOpen_ = false;
    bool eof_ = false;
    std::uint64_t lineNumber_ = 0;
    std::uint64_t recordNumber_ = 0;
    ParserStats stats_;
};

}  // namespace tagc::io

#endif  // TAGC_IO_FASTQ_PARSER_H
