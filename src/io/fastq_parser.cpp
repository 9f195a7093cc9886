// =============================================================================
// tag-counter - FASTQ Parser Implementation
// =============================================================================

#include "tagc/io/fastq_parser.h"

#include "tagc/common/logger.h"
#include "tagc/io/compressed_stream.h"

namespace tagc::io {

// =============================================================================
// FastqParser Implementation
// =============================================================================

FastqParser::FastqParser(std::filesystem::path filePath, ParserOptions options)
    : filePath_(std::move(filePath)), options_(options) {}

FastqParser::FastqParser(std::unique_ptr<std::istream> stream, ParserOptions options)
    : filePath_("<stream>"), options_(options), stream_(std::move(stream)) {
    if (stream_) {
        isOpen_ = true;
    }
}

FastqParser::~FastqParser() { close(); }

FastqParser::FastqParser(FastqParser&&) noexcept = default;
FastqParser& FastqParser::operator=(FastqParser&&) noexcept = default;

void FastqParser::open() {
    if (isOpen_) {
        return;
    }

    stream_ = openInputFile(filePath_);
    TAGC_LOG_DEBUG("Opened FASTQ file: {}", filePath_.string());

    isOpen_ = true;
    eof_ = false;
    lineNumber_ = 0;
    recordNumber_ = 0;
    stats_.reset();
}

void FastqParser::close() noexcept {
    if (!isOpen_) {
        return;
    }

    stream_.reset();
    isOpen_ = false;
    eof_ = true;
}

std::optional<FastqRecord> FastqParser::readRecord() {
    if (!isOpen_ || eof_) {
        return std::nullopt;
    }

    FastqRecord record;
    if (!parseRecord(record)) {
        return std::nullopt;
    }

    ++recordNumber_;
    if (options_.collectStats) {
        stats_.update(record);
    }

    return record;
}

std::optional<FastqParser::Chunk> FastqParser::readChunk(std::size_t maxRecords) {
    if (!isOpen_ || eof_) {
        return std::nullopt;
    }

    Chunk chunk;
    chunk.reserve(maxRecords);

    for (std::size_t i = 0; i < maxRecords && !eof_; ++i) {
        FastqRecord record;
        if (!parseRecord(record)) {
            break;
        }

        ++recordNumber_;
        if (options_.collectStats) {
            stats_.update(record);
        }

        chunk.push_back(std::move(record));
    }

    if (chunk.empty()) {
        return std::nullopt;
    }

    return chunk;
}

bool FastqParser::readLine(std::string& line) {
    if (!stream_ || !*stream_) {
        eof_ = true;
        return false;
    }

    if (!std::getline(*stream_, line)) {
        eof_ = true;
        return false;
    }

    ++lineNumber_;

    if (options_.stripCarriageReturn && !line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    return true;
}

bool FastqParser::parseRecord(FastqRecord& record) {
    record.clear();

    // Line 1: header, skipping blank lines between records
    do {
        if (!readLine(record.header)) {
            return false;
        }
    } while (record.header.empty());

    if (options_.validateStructure && record.header.front() != '@') {
        fail("expected '@' at start of header line");
    }

    // Line 2: sequence
    if (!readLine(record.sequence)) {
        fail("unexpected EOF: missing sequence line");
    }

    // Line 3: separator
    if (!readLine(record.separator)) {
        fail("unexpected EOF: missing '+' line");
    }

    if (options_.validateStructure && (record.separator.empty() || record.separator.front() != '+')) {
        fail("expected '+' at start of separator line");
    }

    // Line 4: quality
    if (!readLine(record.quality)) {
        fail("unexpected EOF: missing quality line");
    }

    if (options_.validateQualityLength && record.quality.size() != record.sequence.size()) {
        fail("quality length (" + std::to_string(record.quality.size()) +
             ") does not match sequence length (" + std::to_string(record.sequence.size()) + ")");
    }

    return true;
}

void FastqParser::fail(std::string message) const {
    throw FormatError("Invalid FASTQ format: " + message,
                      ErrorContext(filePath_.string())
                          .withLine(lineNumber_)
                          .withRecord(recordNumber_ + 1));
}

}  // namespace tagc::io
