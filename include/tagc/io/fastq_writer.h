// =============================================================================
// tag-counter - FASTQ Writer
// =============================================================================
// Serial writer that reproduces FASTQ records line for line.
//
// Records go to "<path>.tmp"; close() renames it to the final path, so an
// interrupted run never leaves a partial file at the destination.
// =============================================================================

#ifndef TAGC_IO_FASTQ_WRITER_H
#define TAGC_IO_FASTQ_WRITER_H

#include <cstdint>
#include <filesystem>
#include <fstream>

#include "tagc/io/fastq_parser.h"

namespace tagc::io {

/// @brief Writes FASTQ records verbatim, in call order.
class FastqWriter {
public:
    FastqWriter() = default;

    /// @brief Construct and open the output.
    /// @throws IOError if the temporary file cannot be created.
    explicit FastqWriter(const std::filesystem::path& path);

    /// @brief Discards the output unless close() succeeded.
    ~FastqWriter();

    FastqWriter(const FastqWriter&) = delete;
    FastqWriter& operator=(const FastqWriter&) = delete;
    FastqWriter(FastqWriter&&) noexcept = default;
    FastqWriter& operator=(FastqWriter&&) noexcept = default;

    /// @brief Start writing to the temporary file beside @p path.
    /// @throws IOError if the temporary file cannot be created.
    void open(const std::filesystem::path& path);

    /// @brief Append one record.
    /// @throws IOError on write failure.
    void write(const FastqRecord& record);

    /// @brief Flush and move the output to its final path; safe to call twice.
    /// @throws IOError if buffered data cannot be written or the rename fails.
    void close();

    /// @brief Drop everything written so far.
    void abort() noexcept;

    [[nodiscard]] bool isOpen() const noexcept { return stream_.is_open(); }
    [[nodiscard]] std::uint64_t recordsWritten() const noexcept { return recordsWritten_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] const std::filesystem::path& tempPath() const noexcept { return tempPath_; }

private:
    void removeTempFile() noexcept;

    std::filesystem::path path_;
    std::filesystem::path tempPath_;
    std::ofstream stream_;
    std::uint64_t recordsWritten_ = 0;
};

}  // namespace tagc::io

#endif  // TAGC_IO_FASTQ_WRITER_H
