// =============================================================================
// tag-counter - Compressed Stream Support
// =============================================================================
// Transparent gzip decompression for FASTQ input.
//
// This module provides:
// - Compression format detection (magic bytes, file extension)
// - GzipStreamBuf: streaming zlib inflate, multi-member aware
// - CompressedInputStream / openInputFile: std::istream over plain or gzip files
//
// Usage:
//   auto stream = openInputFile("/path/to/reads.fastq.gz");
//   // Use stream like any std::istream
// =============================================================================

#ifndef TAGC_IO_COMPRESSED_STREAM_H
#define TAGC_IO_COMPRESSED_STREAM_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <span>
#include <streambuf>
#include <string_view>
#include <vector>

#include "tagc/common/error.h"

namespace tagc::io {

// =============================================================================
// Compression Format Detection
// =============================================================================

/// @brief Input compression formats.
enum class CompressionFormat : std::uint8_t {
    kNone = 0,  ///< Uncompressed (plain text)
    kGzip = 1,  ///< gzip (.gz)
    kUnknown = 255
};

/// @brief Detect compression format from file magic bytes.
[[nodiscard]] CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data);

/// @brief Detect compression format from file extension.
[[nodiscard]] CompressionFormat detectCompressionFormatFromExtension(
    const std::filesystem::path& path);

/// @brief Get human-readable name for compression format.
[[nodiscard]] std::string_view compressionFormatName(CompressionFormat format);

// =============================================================================
// GzipStreamBuf
// =============================================================================

/// @brief Stream buffer for gzip decompression.
/// @note Uses zlib; concatenated gzip members are decoded as one stream.
class GzipStreamBuf : public std::streambuf {
public:
    explicit GzipStreamBuf(std::istream& source, std::size_t bufferSize = 64 * 1024);

    ~GzipStreamBuf() override;

    GzipStreamBuf(const GzipStreamBuf&) = delete;
    GzipStreamBuf& operator=(const GzipStreamBuf&) = delete;
    GzipStreamBuf(GzipStreamBuf&&) = delete;
    GzipStreamBuf& operator=(GzipStreamBuf&&) = delete;

protected:
    /// @brief Underflow handler - refill buffer.
    int_type underflow() override;

private:
    void initZlib();
    void cleanupZlib();

    /// @brief Refill the compressed input buffer from the source.
    /// @return false if the source is exhausted.
    bool refillInput();

    /// @brief Decompress more data into the output buffer.
    /// @return Number of bytes decompressed, 0 at end of input.
    /// @throws IOError on corrupt or truncated gzip data.
    std::size_t decompress();

    std::istream* source_ = nullptr;
    std::vector<std::uint8_t> inputBuffer_;
    std::vector<char> outputBuffer_;

    /// @brief zlib stream state (opaque pointer).
    void* zlibStream_ = nullptr;

    bool streamEnd_ = false;
};

// =============================================================================
// CompressedInputStream
// =============================================================================

/// @brief Input stream with transparent decompression.
class CompressedInputStream : public std::istream {
public:
    /// @brief Open a file, detecting the format from its magic bytes.
    /// @throws IOError if the file cannot be opened.
    explicit CompressedInputStream(const std::filesystem::path& path);

    ~CompressedInputStream() override;

    CompressedInputStream(const CompressedInputStream&) = delete;
    CompressedInputStream& operator=(const CompressedInputStream&) = delete;
    CompressedInputStream(CompressedInputStream&&) = delete;
    CompressedInputStream& operator=(CompressedInputStream&&) = delete;

    [[nodiscard]] CompressionFormat format() const noexcept { return format_; }

    [[nodiscard]] bool isCompressed() const noexcept { return format_ != CompressionFormat::kNone; }

private:
    std::unique_ptr<std::ifstream> fileStream_;
    std::unique_ptr<std::streambuf> decompressBuf_;
    CompressionFormat format_ = CompressionFormat::kUnknown;
};

// =============================================================================
// Factory Functions
// =============================================================================

/// @brief Open a file with automatic decompression.
/// @throws IOError if the file cannot be opened.
[[nodiscard]] std::unique_ptr<std::istream> openInputFile(const std::filesystem::path& path);

}  // namespace tagc::io

#endif  // TAGC_IO_COMPRESSED_STREAM_H
