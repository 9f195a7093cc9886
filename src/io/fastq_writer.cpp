// =============================================================================
// tag-counter - FASTQ Writer Implementation
// =============================================================================

#include "tagc/io/fastq_writer.h"

#include <system_error>

#include <fmt/format.h>

#include "tagc/common/error.h"
#include "tagc/common/logger.h"

namespace tagc::io {

FastqWriter::FastqWriter(const std::filesystem::path& path) { open(path); }

FastqWriter::~FastqWriter() { abort(); }

void FastqWriter::open(const std::filesystem::path& path) {
    abort();

    path_ = path;
    tempPath_ = path_;
    tempPath_ += ".tmp";

    stream_.open(tempPath_, std::ios::binary | std::ios::trunc);
    if (!stream_.is_open()) {
        throw IOError(fmt::format("could not open {} for writing", tempPath_.string()),
                      ErrorContext(path_.string()));
    }
    recordsWritten_ = 0;
    TAGC_LOG_DEBUG("Writing unresolved reads to {} (via {})", path_.string(), tempPath_.string());
}

void FastqWriter::write(const FastqRecord& record) {
    stream_ << record.header << '\n'
            << record.sequence << '\n'
            << record.separator << '\n'
            << record.quality << '\n';
    if (!stream_) {
        throw IOError(fmt::format("failed to write FASTQ record to {}", tempPath_.string()));
    }
    ++recordsWritten_;
}

void FastqWriter::close() {
    if (!stream_.is_open()) {
        return;
    }

    stream_.flush();
    const bool ok = static_cast<bool>(stream_);
    stream_.close();
    if (!ok) {
        removeTempFile();
        throw IOError(fmt::format("failed to flush {}", tempPath_.string()));
    }

    std::error_code ec;
    std::filesystem::rename(tempPath_, path_, ec);
    if (ec) {
        removeTempFile();
        throw IOError(fmt::format("could not move {} to {}", tempPath_.string(), path_.string()),
                      ec);
    }
}

void FastqWriter::abort() noexcept {
    if (!stream_.is_open()) {
        return;
    }
    stream_.close();
    removeTempFile();
    TAGC_LOG_DEBUG("Discarded unfinished output {}", tempPath_.string());
}

void FastqWriter::removeTempFile() noexcept {
    std::error_code ec;
    std::filesystem::remove(tempPath_, ec);
    if (ec) {
        TAGC_LOG_WARNING("could not remove temporary file {}: {}", tempPath_.string(), ec.message());
    }
}

}  // namespace tagc::io
