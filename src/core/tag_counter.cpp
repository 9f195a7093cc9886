// =============================================================================
// tag-counter - Tag Counter Implementation
// =============================================================================

#include "tagc/core/tag_counter.h"

#include <algorithm>
#include <vector>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "tagc/common/logger.h"
#include "tagc/io/read_collection.h"

namespace tagc::core {

TagCounter::TagCounter(const TagMatcher& matcher, CounterOptions options)
    : matcher_(&matcher), options_(options) {
    options_.threads = std::max<std::size_t>(options_.threads, 1);
    options_.chunkSize = std::max<std::size_t>(options_.chunkSize, 1);
    if (options_.threads > 1) {
        arena_ = std::make_unique<tbb::task_arena>(static_cast<int>(options_.threads));
    }
}

TagCounter::~TagCounter() = default;

TagCounter::TagCounter(TagCounter&&) noexcept = default;

TagCounter& TagCounter::operator=(TagCounter&&) noexcept = default;

SampleStats& TagCounter::statsFor(std::string_view sample) {
    auto it = stats_.find(sample);
    if (it == stats_.end()) {
        it = stats_.emplace(std::string(sample), SampleStats{}).first;
    }
    return it->second;
}

void TagCounter::apply(const io::FastqRecord& record, const MatchResult& result,
                       SampleStats& stats, std::string_view sample) {
    ++stats.reads;

    switch (result.outcome) {
        case MatchOutcome::kResolved:
            ++stats.resolved;
            matrix_.increment(result.barcode, sample);
            return;
        case MatchOutcome::kAmbiguous:
            ++stats.ambiguous;
            TAGC_LOG_WARNING("Found {} matching tags in sequence {}, counting as no match",
                             result.foundCount, record.sequence);
            break;
        case MatchOutcome::kNoCandidate:
            ++stats.noCandidate;
            break;
    }

    TAGC_LOG_DEBUG("NOMATCH {}", record.sequence);
    matrix_.increment(kNoMatchKey, sample);
    if (unresolvedWriter_ != nullptr) {
        unresolvedWriter_->write(record);
    }
}

MatchResult TagCounter::countRecord(const io::FastqRecord& record, std::string_view sample) {
    auto result = matcher_->classify(record.sequence);
    apply(record, result, statsFor(sample), sample);
    return result;
}

void TagCounter::countChunk(const io::FastqParser::Chunk& chunk, SampleStats& stats,
                            std::string_view sample) {
    if (!arena_ || chunk.size() < 2) {
        for (const auto& record : chunk) {
            apply(record, matcher_->classify(record.sequence), stats, sample);
        }
        return;
    }

    std::vector<MatchResult> results(chunk.size());
    arena_->execute([&]() {
        tbb::parallel_for(tbb::blocked_range<std::size_t>(0, chunk.size()),
                          [&](const tbb::blocked_range<std::size_t>& range) {
                              for (std::size_t i = range.begin(); i != range.end(); ++i) {
                                  results[i] = matcher_->classify(chunk[i].sequence);
                              }
                          });
    });

    // Fold in input order so counts and side output match the sequential path
    for (std::size_t i = 0; i < chunk.size(); ++i) {
        apply(chunk[i], results[i], stats, sample);
    }
}

Count TagCounter::countStream(io::FastqParser& parser, std::string_view sample) {
    if (!parser.isOpen()) {
        parser.open();
    }

    matrix_.registerSample(sample);
    auto& stats = statsFor(sample);
    const Count before = stats.reads;

    while (auto chunk = parser.readChunk(options_.chunkSize)) {
        countChunk(*chunk, stats, sample);
    }

    return stats.reads - before;
}

Count TagCounter::countCollection(const io::ReadCollection& collection) {
    const std::string sample = io::requireSampleName(collection.name);
    TAGC_LOG_INFO("reading file {} (sample {})", collection.name, sample);

    matrix_.registerSample(sample);

    Count total = 0;
    for (const auto& file : collection.files) {
        TAGC_LOG_DEBUG("reading {}", file.string());
        // Only the sequence line is inspected; header and separator are opaque
        io::FastqParser parser(file, io::ParserOptions{.validateStructure = false});
        parser.open();
        total += countStream(parser, sample);
        const auto& parsed = parser.stats();
        TAGC_LOG_DEBUG("{}: {} records, {} bases, length {}-{} (mean {:.1f})", file.string(),
                       parsed.totalRecords, parsed.totalBases,
                       parsed.totalRecords > 0 ? parsed.minLength : 0, parsed.maxLength,
                       parsed.averageLength());
    }

    const auto& stats = statsFor(sample);
    TAGC_LOG_INFO("sample {}: {} reads, {} resolved, {} no candidate, {} ambiguous", sample,
                  stats.reads, stats.resolved, stats.noCandidate, stats.ambiguous);
    return total;
}

}  // namespace tagc::core
