/**
 * @file ProcessingStats.hpp
 * @brief Run-wide counters gathered while classifying the extracted tree.
 */

#pragma once
#include <cstdint>

namespace foldermapper::domain {

/** @brief Files above this size count as large files (100 MiB). */
constexpr std::uint64_t kLargeFileThreshold = 100ULL * 1024 * 1024;

/**
 * @struct ProcessingStats
 * @brief Snapshot of the counters. All fields only ever grow during a run.
 */
struct ProcessingStats {
    std::uint64_t processedFiles = 0;
    std::uint64_t processedFolders = 0;
    std::uint64_t errorsEncountered = 0;
    std::uint64_t permissionDenials = 0;
    std::uint64_t largeFiles = 0;
    std::uint64_t emptyDirectories = 0;
    std::uint64_t totalSizeBytes = 0;

    bool operator==(const ProcessingStats& other) const {
        return processedFiles == other.processedFiles &&
               processedFolders == other.processedFolders &&
               errorsEncountered == other.errorsEncountered &&
               permissionDenials == other.permissionDenials &&
               largeFiles == other.largeFiles &&
               emptyDirectories == other.emptyDirectories &&
               totalSizeBytes == other.totalSizeBytes;
    }
    bool operator!=(const ProcessingStats& other) const { return !(*this == other); }
};

} // namespace foldermapper::domain
