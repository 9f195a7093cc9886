// =============================================================================
// tag-counter - Count Command
// =============================================================================
// Command handler for a counting run.
//
// This module provides:
// - CountOptions: everything the CLI configures
// - CountSummary: run totals
// - CountCommand: validate, load the reference, count every collection and
//   write the table and the unresolved-read side output
// =============================================================================

#ifndef TAGC_COMMANDS_COUNT_COMMAND_H
#define TAGC_COMMANDS_COUNT_COMMAND_H

#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

#include "tagc/common/types.h"

namespace tagc::commands {

// =============================================================================
// Count Options
// =============================================================================

/// @brief Configuration options for the count command.
struct CountOptions {
    /// @brief Directory holding the read collections.
    std::filesystem::path seqDir;

    /// @brief Gene -> barcode CSV table.
    std::filesystem::path barcodesPath;

    /// @brief One row per barcode instead of one row per gene.
    bool byTag = false;

    /// @brief Sequence 5' of the barcode.
    std::string fivePrimeContext{kDefaultFivePrimeContext};

    /// @brief Sequence 3' of the barcode.
    std::string threePrimeContext{kDefaultThreePrimeContext};

    /// @brief Skip reference rows without a barcode instead of failing.
    bool ignoreMissingTag = false;

    /// @brief FASTQ file receiving every unresolved read.
    std::optional<std::filesystem::path> nomatchOutPath;

    /// @brief Treat subdirectories of .fastq.gz files as collections.
    bool mergeSubdirs = false;

    /// @brief Count table destination (stdout when unset).
    std::optional<std::filesystem::path> outputPath;

    /// @brief Classification threads.
    std::size_t threads = 1;
};

// =============================================================================
// Count Summary
// =============================================================================

/// @brief Totals of a counting run.
struct CountSummary {
    std::size_t collections = 0;
    std::size_t samples = 0;
    Count reads = 0;
    Count resolved = 0;
    Count unresolved = 0;
    std::size_t rows = 0;
    double elapsedSeconds = 0.0;
};

// =============================================================================
// CountCommand Class
// =============================================================================

/// @brief Command handler for counting barcodes in read collections.
class CountCommand {
public:
    /// @brief Construct with options.
    /// @param options Run configuration.
    /// @param output Table destination used when no output path is set
    ///        (defaults to std::cout).
    explicit CountCommand(CountOptions options, std::ostream* output = nullptr);

    ~CountCommand();

    // Non-copyable, movable
    CountCommand(const CountCommand&) = delete;
    CountCommand& operator=(const CountCommand&) = delete;
    CountCommand(CountCommand&&) noexcept;
    CountCommand& operator=(CountCommand&&) noexcept;

    /// @brief Execute the run, reporting failures through the log.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Execute the run.
    /// @throws TagcException on any fatal error.
    void run();

    [[nodiscard]] const CountOptions& options() const noexcept { return options_; }
    [[nodiscard]] const CountSummary& summary() const noexcept { return summary_; }

private:
    /// @brief Check options before touching any file.
    void validateOptions() const;

    /// @brief Log the run totals.
    void logSummary() const;

    CountOptions options_;
    std::ostream* output_;
    CountSummary summary_;
};

}  // namespace tagc::commands

#endif  // TAGC_COMMANDS_COUNT_COMMAND_H
