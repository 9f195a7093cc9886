// =============================================================================
// tag-counter - Read Collections Implementation
// =============================================================================

#include "tagc/io/read_collection.h"

#include <algorithm>
#include <cctype>
#include <system_error>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "tagc/common/error.h"
#include "tagc/common/logger.h"

namespace tagc::io {

namespace {

constexpr std::string_view kFastqToken = "fastq";
constexpr std::string_view kFastqSuffix = ".fastq";
constexpr std::string_view kGzipFastqSuffix = ".fastq.gz";

[[nodiscard]] bool isDigit(char c) noexcept {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] bool endsWith(std::string_view value, std::string_view suffix) noexcept {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

[[nodiscard]] std::vector<std::filesystem::path> gzipFastqFiles(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file() && endsWith(it->path().filename().string(), kGzipFastqSuffix)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw IOError(fmt::format("can't read directory {}", dir.string()), ec);
    }
    std::sort(files.begin(), files.end());
    return files;
}

}  // namespace

std::optional<std::string> parseSampleName(std::string_view collectionName) {
    const std::size_t n = collectionName.size();

    for (std::size_t start = 0; start < n; ++start) {
        if (!isDigit(collectionName[start])) {
            continue;
        }

        std::size_t runEnd = start;
        while (runEnd < n && isDigit(collectionName[runEnd])) {
            ++runEnd;
        }

        // Longest digit run first; one arbitrary character, then "fastq"
        for (std::size_t end = runEnd; end > start; --end) {
            if (end + 1 + kFastqToken.size() <= n &&
                collectionName.compare(end + 1, kFastqToken.size(), kFastqToken) == 0) {
                return std::string(collectionName.substr(0, end));
            }
        }
    }

    return std::nullopt;
}

std::string requireSampleName(std::string_view collectionName) {
    auto sample = parseSampleName(collectionName);
    if (!sample) {
        throw FormatError(fmt::format("could not parse fastq file name '{}'", collectionName));
    }
    return *sample;
}

std::vector<std::string> resolveSampleNames(const std::vector<ReadCollection>& collections) {
    std::vector<std::string> samples;
    samples.reserve(collections.size());
    for (const auto& collection : collections) {
        samples.push_back(requireSampleName(collection.name));
    }

    for (const auto& [sample, sources] : sharedSamples(collections)) {
        const std::string sourceList = fmt::format("{}", fmt::join(sources, ", "));
        TAGC_LOG_WARNING("sample {} is fed by {} collections ({}); their counts are summed",
                         sample, sources.size(), sourceList);
    }
    return samples;
}

std::map<std::string, std::vector<std::string>, std::less<>> sharedSamples(
    const std::vector<ReadCollection>& collections) {
    std::map<std::string, std::vector<std::string>, std::less<>> bySample;
    for (const auto& collection : collections) {
        if (auto sample = parseSampleName(collection.name)) {
            bySample[*sample].push_back(collection.name);
        }
    }

    std::erase_if(bySample, [](const auto& entry) { return entry.second.size() < 2; });
    return bySample;
}

std::vector<ReadCollection> discoverCollections(const std::filesystem::path& directory,
                                                const DiscoveryOptions& options) {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        throw IOError(fmt::format("{} not a directory", directory.string()));
    }

    std::vector<ReadCollection> collections;
    for (std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end;
         it.increment(ec)) {
        const auto& entry = *it;
        const std::string name = entry.path().filename().string();

        if (entry.is_regular_file()) {
            if (endsWith(name, kFastqSuffix) || endsWith(name, kGzipFastqSuffix)) {
                collections.push_back({name, {entry.path()}});
            }
        } else if (options.mergeSubdirectories && entry.is_directory()) {
            auto files = gzipFastqFiles(entry.path());
            if (files.empty()) {
                TAGC_LOG_DEBUG("skipping subdirectory {} without .fastq.gz files", name);
                continue;
            }
            collections.push_back({name + std::string(kFastqSuffix), std::move(files)});
        }
    }
    if (ec) {
        throw IOError(fmt::format("can't opendir {}", directory.string()), ec);
    }

    std::sort(collections.begin(), collections.end(),
              [](const ReadCollection& a, const ReadCollection& b) { return a.name < b.name; });
    return collections;
}

}  // namespace tagc::io
