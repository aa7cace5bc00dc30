/**
 * @file ParallelClassifier.hpp
 * @brief Classifies walker batches on a bounded worker pool.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>
#include "application/StatsAggregator.hpp"
#include "application/WorkerPool.hpp"
#include "domain/StructureItem.hpp"
#include "infrastructure/DirectoryWalker.hpp"
#include "infrastructure/FileSystemItemInspector.hpp"

namespace foldermapper::application {

/**
 * @class ParallelClassifier
 * @brief Pulls one batch at a time, fans its entries out to maxWorkers threads
 *        and waits for the whole batch before pulling the next.
 *
 * A failing entry is logged, counted under errorsEncountered and dropped; it
 * never aborts its batch or the run. Entries whose access was refused are
 * kept (accessible=false) and counted under permissionDenials.
 */
class ParallelClassifier {
public:
    using Inspection = infrastructure::FileSystemItemInspector::Inspection;
    using InspectFn = std::function<Inspection(const domain::WalkEntry&)>;

    /**
     * @struct Summary
     * @brief Bookkeeping of a classifyAll() call.
     */
    struct Summary {
        std::size_t batches = 0;
        std::size_t entriesSubmitted = 0;
        std::size_t itemsDropped = 0;
    };

    ParallelClassifier(const infrastructure::FileSystemItemInspector& inspector,
                       StatsAggregator& stats, std::size_t maxWorkers);

    /** @brief Variant with a custom inspection step. */
    ParallelClassifier(InspectFn inspect, StatsAggregator& stats, std::size_t maxWorkers);

    /**
     * @brief Drains @p walker and returns every successfully classified item.
     *
     * Order of the returned items depends on scheduling; callers sort.
     */
    std::vector<domain::StructureItem> classifyAll(infrastructure::DirectoryWalker& walker);

    /** @brief Classifies one batch and blocks until all its entries are done. */
    void classifyBatch(const domain::Batch& batch);

    /** @brief Moves out the items collected so far. */
    std::vector<domain::StructureItem> takeResults();

    const Summary& summary() const { return m_summary; }
    std::size_t maxWorkers() const { return m_pool.WorkerCount(); }

private:
    void classifyOne(const domain::WalkEntry& entry);

    InspectFn m_inspect;
    StatsAggregator& m_stats;
    WorkerPool m_pool;

    std::mutex m_resultsMutex;
    std::vector<domain::StructureItem> m_results;
    std::size_t m_dropped = 0;

    Summary m_summary;
    std::chrono::steady_clock::time_point m_startTime;
};

} // namespace foldermapper::application
