/**
 * @file StatsAggregator.cpp
 * @brief Implementation of StatsAggregator.
 */

#include "application/StatsAggregator.hpp"

namespace foldermapper::application {

void StatsAggregator::recordFile(std::uint64_t sizeBytes, bool accessible) {
    const std::uint64_t size = accessible ? sizeBytes : 0;
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_stats.processedFiles;
    m_stats.totalSizeBytes += size;
    if (size > domain::kLargeFileThreshold) {
        ++m_stats.largeFiles;
    }
}

void StatsAggregator::recordDirectory(bool isEmpty) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_stats.processedFolders;
    if (isEmpty) {
        ++m_stats.emptyDirectories;
    }
}

void StatsAggregator::recordError() {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_stats.errorsEncountered;
}

void StatsAggregator::recordPermissionDenied() {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_stats.permissionDenials;
}

domain::ProcessingStats StatsAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

} // namespace foldermapper::application
