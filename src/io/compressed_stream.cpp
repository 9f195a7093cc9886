// =============================================================================
// tag-counter - Compressed Stream Implementation
// =============================================================================

#include "tagc/io/compressed_stream.h"

#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <string>

#include "tagc/common/logger.h"

namespace tagc::io {

namespace {

// Gzip magic: 0x1f 0x8b
constexpr std::uint8_t kGzipMagic[] = {0x1f, 0x8b};

}  // namespace

// =============================================================================
// Format Detection
// =============================================================================

CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data) {
    if (data.size() >= sizeof(kGzipMagic) &&
        std::memcmp(data.data(), kGzipMagic, sizeof(kGzipMagic)) == 0) {
        return CompressionFormat::kGzip;
    }
    return CompressionFormat::kNone;
}

CompressionFormat detectCompressionFormatFromExtension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".gz" || ext == ".gzip") {
        return CompressionFormat::kGzip;
    }
    return CompressionFormat::kNone;
}

std::string_view compressionFormatName(CompressionFormat format) {
    switch (format) {
        case CompressionFormat::kGzip:
            return "gzip";
        case CompressionFormat::kNone:
            return "none";
        case CompressionFormat::kUnknown:
        default:
            return "unknown";
    }
}

// =============================================================================
// GzipStreamBuf Implementation
// =============================================================================

GzipStreamBuf::GzipStreamBuf(std::istream& source, std::size_t bufferSize)
    : source_(&source), inputBuffer_(bufferSize), outputBuffer_(bufferSize) {
    initZlib();
}

GzipStreamBuf::~GzipStreamBuf() { cleanupZlib(); }

void GzipStreamBuf::initZlib() {
    auto* stream = new z_stream;
    std::memset(stream, 0, sizeof(z_stream));

    // 16 + MAX_WBITS selects the gzip wrapper
    int ret = inflateInit2(stream, 16 + MAX_WBITS);
    if (ret != Z_OK) {
        delete stream;
        throw IOError("Failed to initialize zlib: " + std::string(zError(ret)));
    }

    zlibStream_ = stream;
}

void GzipStreamBuf::cleanupZlib() {
    if (zlibStream_) {
        auto* stream = static_cast<z_stream*>(zlibStream_);
        inflateEnd(stream);
        delete stream;
        zlibStream_ = nullptr;
    }
}

GzipStreamBuf::int_type GzipStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    std::size_t decompressed = decompress();
    if (decompressed == 0) {
        return traits_type::eof();
    }

    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + decompressed);
    return traits_type::to_int_type(*gptr());
}

bool GzipStreamBuf::refillInput() {
    auto* stream = static_cast<z_stream*>(zlibStream_);
    if (!*source_) {
        return false;
    }
    source_->read(reinterpret_cast<char*>(inputBuffer_.data()),
                  static_cast<std::streamsize>(inputBuffer_.size()));
    auto bytesRead = static_cast<std::size_t>(source_->gcount());
    if (bytesRead == 0) {
        return false;
    }
    stream->avail_in = static_cast<uInt>(bytesRead);
    stream->next_in = inputBuffer_.data();
    return true;
}

std::size_t GzipStreamBuf::decompress() {
    if (!zlibStream_ || !source_) {
        return 0;
    }

    auto* stream = static_cast<z_stream*>(zlibStream_);

    while (true) {
        if (stream->avail_in == 0 && !refillInput()) {
            if (!streamEnd_) {
                throw IOError("Gzip decompression failed: unexpected end of compressed data");
            }
            return 0;
        }

        // A new member follows the previous one
        if (streamEnd_) {
            if (inflateReset(stream) != Z_OK) {
                throw IOError("Gzip decompression failed: cannot reset inflate state");
            }
            streamEnd_ = false;
        }

        stream->avail_out = static_cast<uInt>(outputBuffer_.size());
        stream->next_out = reinterpret_cast<Bytef*>(outputBuffer_.data());

        int ret = inflate(stream, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            streamEnd_ = true;
        } else if (ret != Z_OK && ret != Z_BUF_ERROR) {
            throw IOError("Gzip decompression failed: " + std::string(zError(ret)));
        }

        std::size_t produced = outputBuffer_.size() - stream->avail_out;
        if (produced > 0) {
            return produced;
        }
    }
}

// =============================================================================
// CompressedInputStream Implementation
// =============================================================================

CompressedInputStream::CompressedInputStream(const std::filesystem::path& path)
    : std::istream(nullptr) {
    fileStream_ = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!fileStream_->is_open()) {
        throw IOError("Failed to open file: " + path.string());
    }

    // Detect format from magic bytes
    std::uint8_t magic[2];
    fileStream_->read(reinterpret_cast<char*>(magic), sizeof(magic));
    auto bytesRead = static_cast<std::size_t>(fileStream_->gcount());

    fileStream_->clear();
    fileStream_->seekg(0, std::ios::beg);

    format_ = detectCompressionFormat({magic, bytesRead});

    if (format_ == CompressionFormat::kGzip) {
        decompressBuf_ = std::make_unique<GzipStreamBuf>(*fileStream_);
        rdbuf(decompressBuf_.get());
    } else {
        if (detectCompressionFormatFromExtension(path) == CompressionFormat::kGzip && bytesRead > 0) {
            TAGC_LOG_WARNING("{} has a gzip extension but no gzip header; reading as plain text",
                             path.string());
        }
        rdbuf(fileStream_->rdbuf());
    }
    TAGC_LOG_DEBUG("Opened {} ({} input)", path.string(), compressionFormatName(format_));

    // Decompression errors raised inside the buffer propagate to the reader
    exceptions(std::ios::badbit);
}

CompressedInputStream::~CompressedInputStream() {
    // Detach before the owned buffers are destroyed
    exceptions(std::ios::goodbit);
    rdbuf(nullptr);
}

// =============================================================================
// Factory Functions
// =============================================================================

std::unique_ptr<std::istream> openInputFile(const std::filesystem::path& path) {
    return std::make_unique<CompressedInputStream>(path);
}

}  // namespace tagc::io
