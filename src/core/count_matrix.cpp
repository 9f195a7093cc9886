// =============================================================================
// tag-counter - Count Matrix Implementation
// =============================================================================

#include "tagc/core/count_matrix.h"

namespace tagc::core {

void CountMatrix::registerSample(std::string_view sample) {
    if (samples_.find(sample) == samples_.end()) {
        samples_.emplace(sample);
    }
}

void CountMatrix::increment(std::string_view key, std::string_view sample, Count amount) {
    registerSample(sample);

    auto rowIt = rows_.find(key);
    if (rowIt == rows_.end()) {
        rowIt = rows_.emplace(std::string(key), SampleCounts{}).first;
    }

    auto cellIt = rowIt->second.find(sample);
    if (cellIt == rowIt->second.end()) {
        rowIt->second.emplace(std::string(sample), amount);
    } else {
        cellIt->second += amount;
    }
}

void CountMatrix::merge(const CountMatrix& other) {
    for (const auto& sample : other.samples_) {
        registerSample(sample);
    }
    for (const auto& [key, counts] : other.rows_) {
        for (const auto& [sample, value] : counts) {
            increment(key, sample, value);
        }
    }
}

Count CountMatrix::count(std::string_view key, std::string_view sample) const {
    auto rowIt = rows_.find(key);
    if (rowIt == rows_.end()) {
        return 0;
    }
    auto cellIt = rowIt->second.find(sample);
    return cellIt != rowIt->second.end() ? cellIt->second : 0;
}

Count CountMatrix::sampleTotal(std::string_view sample) const {
    Count sum = 0;
    for (const auto& [key, counts] : rows_) {
        auto it = counts.find(sample);
        if (it != counts.end()) {
            sum += it->second;
        }
    }
    return sum;
}

Count CountMatrix::total() const {
    Count sum = 0;
    for (const auto& [key, counts] : rows_) {
        for (const auto& [sample, value] : counts) {
            sum += value;
        }
    }
    return sum;
}

std::vector<std::string> CountMatrix::samples() const {
    return {samples_.begin(), samples_.end()};
}

std::vector<std::string> CountMatrix::orderedKeys() const {
    std::vector<std::string> keys;
    keys.reserve(rows_.size());

    if (hasKey(kNoMatchKey)) {
        keys.emplace_back(kNoMatchKey);
    }
    for (const auto& [key, counts] : rows_) {
        if (key != kNoMatchKey) {
            keys.push_back(key);
        }
    }
    return keys;
}

}  // namespace tagc::core
