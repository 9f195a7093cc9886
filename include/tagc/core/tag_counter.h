// =============================================================================
// tag-counter - Tag Counter
// =============================================================================
// Drives the TagMatcher over read collections and accumulates the
// CountMatrix.
//
// This module provides:
// - CounterOptions: threading and batching
// - SampleStats: per-sample diagnostics
// - TagCounter: per-read classification, aggregation and unresolved side output
//
// Every read increments exactly one cell: its resolved barcode, or no_match.
// Unresolved reads are optionally written verbatim, in input order, to a
// FASTQ side channel.
//
// With more than one thread, each chunk of reads is classified in parallel
// (TBB); aggregation and side output stay on the calling thread in input
// order, so results match the sequential path exactly.
// =============================================================================

#ifndef TAGC_CORE_TAG_COUNTER_H
#define TAGC_CORE_TAG_COUNTER_H

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include <tbb/task_arena.h>

#include "tagc/common/types.h"
#include "tagc/core/count_matrix.h"
#include "tagc/core/tag_matcher.h"
#include "tagc/io/fastq_parser.h"
#include "tagc/io/fastq_writer.h"
#include "tagc/io/read_collection.h"

namespace tagc::core {

// =============================================================================
// Counter Options
// =============================================================================

/// @brief Configuration options for TagCounter.
struct CounterOptions {
    /// @brief Classification threads (1 = sequential).
    std::size_t threads = 1;

    /// @brief Reads per parallel batch.
    std::size_t chunkSize = kDefaultChunkSize;
};

// =============================================================================
// Sample Statistics
// =============================================================================

/// @brief Per-sample classification counts.
struct SampleStats {
    Count reads = 0;
    Count resolved = 0;
    Count noCandidate = 0;
    Count ambiguous = 0;

    [[nodiscard]] Count unresolved() const noexcept { return noCandidate + ambiguous; }
};

// =============================================================================
// TagCounter Class
// =============================================================================

/// @brief Accumulates a CountMatrix from reads.
///
/// Thread Safety:
/// - Not thread-safe; one counter per run. Parallelism is internal.
class TagCounter {
public:
    /// @brief Construct a counter.
    /// @param matcher Classifier; must outlive the counter.
    /// @param options Threading options.
    explicit TagCounter(const TagMatcher& matcher, CounterOptions options = {});

    ~TagCounter();

    TagCounter(const TagCounter&) = delete;
    TagCounter& operator=(const TagCounter&) = delete;
    TagCounter(TagCounter&&) noexcept;
    TagCounter& operator=(TagCounter&&) noexcept;

    /// @brief Send unresolved reads to a writer (nullptr disables).
    /// @note The writer is not owned and must outlive counting.
    void setUnresolvedWriter(io::FastqWriter* writer) noexcept { unresolvedWriter_ = writer; }

    /// @brief Classify and count one record.
    /// @return The classification.
    MatchResult countRecord(const io::FastqRecord& record, std::string_view sample);

    /// @brief Count every record of an open parser.
    /// @return Number of records counted.
    /// @throws FormatError on malformed input.
    Count countStream(io::FastqParser& parser, std::string_view sample);

    /// @brief Count a whole read collection under its parsed sample name.
    /// @return Number of records counted.
    /// @throws FormatError if the collection name has no sample token.
    /// @throws IOError if a file cannot be opened.
    Count countCollection(const io::ReadCollection& collection);

    [[nodiscard]] const CountMatrix& matrix() const noexcept { return matrix_; }

    /// @brief Per-sample diagnostics, keyed by sample.
    [[nodiscard]] const std::map<std::string, SampleStats, std::less<>>& sampleStats() const noexcept {
        return stats_;
    }

    [[nodiscard]] const CounterOptions& options() const noexcept { return options_; }

private:
    /// @brief Fold one classified record into the matrix, stats and side output.
    void apply(const io::FastqRecord& record, const MatchResult& result, SampleStats& stats,
               std::string_view sample);

    /// @brief Classify a chunk in parallel and apply results in order.
    void countChunk(const io::FastqParser::Chunk& chunk, SampleStats& stats,
                    std::string_view sample);

    SampleStats& statsFor(std::string_view sample);

    const TagMatcher* matcher_;
    CounterOptions options_;
    CountMatrix matrix_;
    std::map<std::string, SampleStats, std::less<>> stats_;
    io::FastqWriter* unresolvedWriter_ = nullptr;
    std::unique_ptr<tbb::task_arena> arena_;
};

}  // namespace tagc::core

#endif  // TAGC_CORE_TAG_COUNTER_H
