/**
 * @file StatsAggregator.hpp
 * @brief Lock-guarded accumulation of ProcessingStats across worker threads.
 */

#pragma once
#include <cstdint>
#include <mutex>
#include "domain/ProcessingStats.hpp"

namespace foldermapper::application {

/**
 * @class StatsAggregator
 * @brief Every increment takes the same mutex, so concurrent workers never lose updates.
 */
class StatsAggregator {
public:
    /** @brief Counts a processed file; inaccessible files contribute size 0. */
    void recordFile(std::uint64_t sizeBytes, bool accessible);
    void recordDirectory(bool isEmpty);
    void recordError();
    void recordPermissionDenied();

    /** @brief Consistent copy of all counters. */
    domain::ProcessingStats snapshot() const;

private:
    mutable std::mutex m_mutex;
    domain::ProcessingStats m_stats;
};

} // namespace foldermapper::application
