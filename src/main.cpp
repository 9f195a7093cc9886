// =============================================================================
// tag-counter - Barcode Tag Counter
// =============================================================================
// Main entry point for the tagc command-line tool.
//
// This file implements the CLI using CLI11, providing:
// - Run options: sequence directory, barcode table, flanking contexts
// - Output options: count table destination, unresolved-read FASTQ
// - Global options: threads, verbosity, log file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

#include "tagc/common/error.h"
#include "tagc/common/logger.h"
#include "tagc/common/types.h"

#include "commands/count_command.h"

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "tagc: count DNA barcode tags in FASTQ reads, per sample\n"
    "A barcode is recognised between the last bases of the 5' context and the\n"
    "first bases of the 3' context, on either strand. The count table is written\n"
    "as CSV (rows: barcodes or genes, columns: samples).";

// =============================================================================
// CLI Options
// =============================================================================

struct GlobalOptions {
    int threads = 1;
    int verbosity = 0;  // 0 = normal, 1+ = debug
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

struct CliCountOptions {
    std::string seqDir;
    std::string barcodes;
    bool byTag = false;
    std::string fivePrimeSeq{tagc::kDefaultFivePrimeContext};
    std::string threePrimeSeq{tagc::kDefaultThreePrimeContext};
    bool ignoreMissingTag = false;
    std::string nomatchOutFile;
    bool mergeSubdirs = false;
    std::string output;
};

CliCountOptions gCountOpts;

// =============================================================================
// Option Setup
// =============================================================================

void setupCountOptions(CLI::App& app) {
    app.add_option("--seq_dir,--seq-dir", gCountOpts.seqDir, "Directory of FASTQ files")
        ->required()
        ->check(CLI::ExistingDirectory);

    app.add_option("--barcodes", gCountOpts.barcodes,
                   "Gene/barcode CSV table ('gene id' or 'gene_id', 'tag' or 'barcode' columns)")
        ->required()
        ->check(CLI::ExistingFile);

    app.add_flag("--by_tag,--by-tag", gCountOpts.byTag,
                 "One row per barcode instead of one row per gene");

    app.add_option("--five_p_seq,--five-p-seq", gCountOpts.fivePrimeSeq,
                   "Sequence 5' of the barcode")
        ->capture_default_str();

    app.add_option("--three_p_seq,--three-p-seq", gCountOpts.threePrimeSeq,
                   "Sequence 3' of the barcode")
        ->capture_default_str();

    app.add_flag("--ignore_missing_tag,--ignore-missing-tag", gCountOpts.ignoreMissingTag,
                 "Skip barcode table rows without a barcode instead of failing");

    app.add_option("--nomatch_out_file,--nomatch-out-file", gCountOpts.nomatchOutFile,
                   "Write reads without a unique known barcode to this FASTQ file");

    app.add_flag("--merge_subdirs,--merge-subdirs", gCountOpts.mergeSubdirs,
                 "Count each subdirectory of .fastq.gz files as one sample");

    app.add_option("-o,--output", gCountOpts.output, "Count table file (default: stdout)");
}

void setupGlobalOptions(CLI::App& app) {
    app.add_option("-t,--threads", gOptions.threads, "Number of classification threads")
        ->default_val(1)
        ->check(CLI::PositiveNumber);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v for debug)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Only report errors");

    app.add_option("--log-file", gOptions.logFile, "Also write the log to this file");
}

[[nodiscard]] tagc::commands::CountOptions buildCountOptions() {
    tagc::commands::CountOptions opts;
    opts.seqDir = gCountOpts.seqDir;
    opts.barcodesPath = gCountOpts.barcodes;
    opts.byTag = gCountOpts.byTag;
    opts.fivePrimeContext = gCountOpts.fivePrimeSeq;
    opts.threePrimeContext = gCountOpts.threePrimeSeq;
    opts.ignoreMissingTag = gCountOpts.ignoreMissingTag;
    opts.mergeSubdirs = gCountOpts.mergeSubdirs;
    opts.threads = static_cast<std::size_t>(gOptions.threads);
    if (!gCountOpts.nomatchOutFile.empty()) {
        opts.nomatchOutPath = gCountOpts.nomatchOutFile;
    }
    if (!gCountOpts.output.empty() && gCountOpts.output != "-") {
        opts.outputPath = gCountOpts.output;
    }
    return opts;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription, "tagc"};
    app.set_version_flag("-V,--version", kVersion);

    setupCountOptions(app);
    setupGlobalOptions(app);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int rc = app.exit(e);
        return rc == 0 ? EXIT_SUCCESS : tagc::toExitCode(tagc::ErrorCode::kUsageError);
    }

    // Initialize logger
    try {
        auto logLevel = tagc::log::Level::kInfo;
        if (gOptions.quiet) {
            logLevel = tagc::log::Level::kError;
        } else if (gOptions.verbosity >= 1) {
            logLevel = tagc::log::Level::kDebug;
        }
        tagc::log::init(gOptions.logFile, logLevel);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int rc = EXIT_SUCCESS;
    try {
        tagc::commands::CountCommand cmd(buildCountOptions());
        rc = cmd.execute();
    } catch (const tagc::TagcException& ex) {
        TAGC_LOG_ERROR("Error: {}", ex.what());
        rc = ex.exitCode();
    } catch (const std::exception& ex) {
        TAGC_LOG_ERROR("Unexpected error: {}", ex.what());
        rc = EXIT_FAILURE;
    }

    tagc::log::shutdown();
    return rc;
}
