// =============================================================================
// tag-counter - Read Collections
// =============================================================================
// Discovery of per-sample read collections in the sequence directory and
// extraction of the sample name from a collection name.
//
// A collection is either a single FASTQ file (`*.fastq`, `*.fastq.gz`) or,
// when subdirectory merging is enabled, a subdirectory whose `*.fastq.gz`
// files are streamed back to back under the name `<subdir>.fastq`.
// =============================================================================

#ifndef TAGC_IO_READ_COLLECTION_H
#define TAGC_IO_READ_COLLECTION_H

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tagc::io {

/// @brief One sample's reads.
struct ReadCollection {
    /// @brief Name the sample token is parsed from.
    std::string name;

    /// @brief Files making up the collection, in read order.
    std::vector<std::filesystem::path> files;
};

/// @brief Options for collection discovery.
struct DiscoveryOptions {
    /// @brief Also treat subdirectories of gzip FASTQ files as collections.
    bool mergeSubdirectories = false;
};

/// @brief Extract the sample token from a collection name.
///
/// The sample is the shortest prefix ending in a run of digits that is
/// followed by one arbitrary character and then "fastq"; for a given start of
/// the run the longest run is preferred ("sample12.fastq" -> "sample12").
///
/// @return The sample, or nullopt if the name has no such token.
[[nodiscard]] std::optional<std::string> parseSampleName(std::string_view collectionName);

/// @brief Like parseSampleName(), but fatal when no token is found.
/// @throws FormatError if the name cannot be parsed.
[[nodiscard]] std::string requireSampleName(std::string_view collectionName);

/// @brief Parse the sample of every collection before any of them is read.
///
/// Logs a warning for each sample fed by more than one collection (for
/// instance "x1.fastq" next to "x1.fastq.gz"); their counts are summed.
///
/// @return Sample names, index-aligned with @p collections.
/// @throws FormatError naming the first collection without a sample token.
[[nodiscard]] std::vector<std::string> resolveSampleNames(
    const std::vector<ReadCollection>& collections);

/// @brief Samples fed by more than one collection, with those collections' names.
[[nodiscard]] std::map<std::string, std::vector<std::string>, std::less<>> sharedSamples(
    const std::vector<ReadCollection>& collections);

/// @brief List the read collections of a directory, ordered by name.
/// @throws IOError if the directory cannot be read.
[[nodiscard]] std::vector<ReadCollection> discoverCollections(const std::filesystem::path& directory,
                                                              const DiscoveryOptions& options = {});

}  // namespace tagc::io

#endif  // TAGC_IO_READ_COLLECTION_H
