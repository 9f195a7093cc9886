// =============================================================================
// tag-counter - Count Command Implementation
// =============================================================================

#include "count_command.h"

#include <chrono>
#include <iostream>
#include <utility>

#include "tagc/common/error.h"
#include "tagc/common/logger.h"
#include "tagc/core/barcode_reference.h"
#include "tagc/core/primer_context.h"
#include "tagc/core/tag_counter.h"
#include "tagc/core/tag_matcher.h"
#include "tagc/io/barcode_table_reader.h"
#include "tagc/io/fastq_writer.h"
#include "tagc/io/read_collection.h"
#include "tagc/report/count_table_writer.h"

namespace tagc::commands {

// =============================================================================
// CountCommand Implementation
// =============================================================================

CountCommand::CountCommand(CountOptions options, std::ostream* output)
    : options_(std::move(options)), output_(output != nullptr ? output : &std::cout) {}

CountCommand::~CountCommand() = default;

CountCommand::CountCommand(CountCommand&&) noexcept = default;
CountCommand& CountCommand::operator=(CountCommand&&) noexcept = default;

int CountCommand::execute() {
    try {
        run();
        logSummary();
        return 0;
    } catch (const TagcException& e) {
        TAGC_LOG_ERROR("Count failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        TAGC_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kUsageError);
    }
}

void CountCommand::run() {
    const auto startTime = std::chrono::steady_clock::now();
    summary_ = CountSummary{};

    validateOptions();

    // Reference and anchors
    const auto rows = io::readBarcodeTable(options_.barcodesPath);
    const auto reference = core::BarcodeReference::load(
        rows, core::ReferenceOptions{.ignoreMissingTag = options_.ignoreMissingTag});
    TAGC_LOG_INFO("Loaded {} barcodes from {}", reference.size(), options_.barcodesPath.string());
    if (reference.empty()) {
        TAGC_LOG_WARNING("barcode table {} contains no usable barcodes; every read will be no_match",
                         options_.barcodesPath.string());
    }

    core::TagMatcher matcher(reference,
                             core::PrimerContext(options_.fivePrimeContext,
                                                 options_.threePrimeContext));
    TAGC_LOG_DEBUG("Anchors: 5' {} / 3' {}", matcher.context().fivePrimeAnchor(),
                   matcher.context().threePrimeAnchor());

    const auto collections = io::discoverCollections(
        options_.seqDir, io::DiscoveryOptions{.mergeSubdirectories = options_.mergeSubdirs});
    if (collections.empty()) {
        TAGC_LOG_WARNING("no FASTQ files found in {}", options_.seqDir.string());
    }
    (void)io::resolveSampleNames(collections);

    // Unresolved reads go to a temporary file that is only moved into place
    // once the table is written; on any failure the writer discards it
    io::FastqWriter nomatchWriter;
    if (options_.nomatchOutPath) {
        nomatchWriter.open(*options_.nomatchOutPath);
    }

    core::TagCounter counter(matcher, core::CounterOptions{.threads = options_.threads});
    if (nomatchWriter.isOpen()) {
        counter.setUnresolvedWriter(&nomatchWriter);
    }

    for (const auto& collection : collections) {
        counter.countCollection(collection);
    }

    // Report
    const auto table = report::CountTable::build(counter.matrix(), reference,
                                                 report::ReportOptions{.byTag = options_.byTag});
    if (options_.outputPath) {
        report::writeCsv(table, *options_.outputPath);
    } else {
        report::writeCsv(table, *output_);
    }

    if (nomatchWriter.isOpen()) {
        nomatchWriter.close();
        TAGC_LOG_INFO("Wrote {} unresolved reads to {}", nomatchWriter.recordsWritten(),
                      nomatchWriter.path().string());
    }

    summary_.collections = collections.size();
    summary_.samples = table.samples().size();
    summary_.rows = table.rows().size();
    for (const auto& [sample, stats] : counter.sampleStats()) {
        summary_.reads += stats.reads;
        summary_.resolved += stats.resolved;
        summary_.unresolved += stats.unresolved();
    }

    const auto endTime = std::chrono::steady_clock::now();
    summary_.elapsedSeconds = std::chrono::duration<double>(endTime - startTime).count();
}

void CountCommand::validateOptions() const {
    if (options_.seqDir.empty()) {
        throw UsageError("no sequence directory given (--seq_dir)");
    }
    if (options_.barcodesPath.empty()) {
        throw UsageError("no barcode table given (--barcodes)");
    }
    if (options_.threads == 0) {
        throw UsageError("thread count must be at least 1");
    }
    if (options_.outputPath && options_.outputPath->empty()) {
        throw UsageError("empty output path");
    }
    if (options_.nomatchOutPath && options_.nomatchOutPath->empty()) {
        throw UsageError("empty no-match output path");
    }

    TAGC_LOG_DEBUG("Count options validated");
    TAGC_LOG_DEBUG("  Sequence dir: {}", options_.seqDir.string());
    TAGC_LOG_DEBUG("  Barcodes: {}", options_.barcodesPath.string());
    TAGC_LOG_DEBUG("  By tag: {}", options_.byTag);
    TAGC_LOG_DEBUG("  Merge subdirs: {}", options_.mergeSubdirs);
    TAGC_LOG_DEBUG("  Threads: {}", options_.threads);
}

void CountCommand::logSummary() const {
    const double resolvedPercent =
        summary_.reads > 0
            ? 100.0 * static_cast<double>(summary_.resolved) / static_cast<double>(summary_.reads)
            : 0.0;

    TAGC_LOG_INFO("=== Count Summary ===");
    TAGC_LOG_INFO("  Collections:  {}", summary_.collections);
    TAGC_LOG_INFO("  Samples:      {}", summary_.samples);
    TAGC_LOG_INFO("  Reads:        {}", summary_.reads);
    TAGC_LOG_INFO("  Resolved:     {} ({:.2f}%)", summary_.resolved, resolvedPercent);
    TAGC_LOG_INFO("  Unresolved:   {}", summary_.unresolved);
    TAGC_LOG_INFO("  Table rows:   {}", summary_.rows);
    TAGC_LOG_INFO("  Elapsed time: {:.2f} s", summary_.elapsedSeconds);
}

}  // namespace tagc::commands
