/**
 * @file ParallelClassifier.cpp
 * @brief Implementation of ParallelClassifier.
 */

#include "application/ParallelClassifier.hpp"
#include "domain/MappingErrors.hpp"
#include "infrastructure/Logger.hpp"
#include <cstdint>
#include <filesystem>
#include <iomanip>

namespace foldermapper::application {

namespace {
const char* kComponent = "Classifier";
}

ParallelClassifier::ParallelClassifier(const infrastructure::FileSystemItemInspector& inspector,
                                       StatsAggregator& stats, std::size_t maxWorkers)
    : ParallelClassifier([&inspector](const domain::WalkEntry& entry) { return inspector.inspect(entry); },
                         stats, maxWorkers) {}

ParallelClassifier::ParallelClassifier(InspectFn inspect, StatsAggregator& stats, std::size_t maxWorkers)
    : m_inspect(std::move(inspect)), m_stats(stats), m_pool(maxWorkers),
      m_startTime(std::chrono::steady_clock::now()) {}

std::vector<domain::StructureItem> ParallelClassifier::classifyAll(infrastructure::DirectoryWalker& walker) {
    m_startTime = std::chrono::steady_clock::now();
    FM_LOG(Info, kComponent, "Starting directory mapping with " << m_pool.WorkerCount() << " workers");

    while (auto batch = walker.nextBatch()) {
        classifyBatch(*batch);

        auto snapshot = m_stats.snapshot();
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - m_startTime).count();
        FM_LOG(Info, kComponent, "Progress: " << snapshot.processedFiles << " files, "
               << snapshot.processedFolders << " folders processed in "
               << std::fixed << std::setprecision(2) << elapsed << "s");
    }

    auto snapshot = m_stats.snapshot();
    FM_LOG(Info, kComponent, "Mapping completed: " << snapshot.processedFiles << " files, "
           << snapshot.processedFolders << " folders, " << snapshot.errorsEncountered << " errors");
    return takeResults();
}

void ParallelClassifier::classifyBatch(const domain::Batch& batch) {
    ++m_summary.batches;
    m_summary.entriesSubmitted += batch.size();

    for (const auto& entry : batch) {
        m_pool.Submit([this, &entry] { classifyOne(entry); });
    }
    m_pool.WaitIdle();

    std::lock_guard<std::mutex> lock(m_resultsMutex);
    m_summary.itemsDropped = m_dropped;
}

void ParallelClassifier::classifyOne(const domain::WalkEntry& entry) {
    try {
        Inspection inspection = m_inspect(entry);
        const bool isDirectory = inspection.item.isDirectory();
        const bool isEmpty = inspection.item.directory.isEmpty;
        const std::uint64_t sizeBytes = inspection.item.file.sizeBytes;
        const bool accessible = inspection.item.accessible;

        // Counted only once the item is stored, so a failed insert is not also a processed item.
        {
            std::lock_guard<std::mutex> lock(m_resultsMutex);
            m_results.push_back(std::move(inspection.item));
        }

        if (inspection.permissionDenied) {
            m_stats.recordPermissionDenied();
        }
        if (isDirectory) {
            m_stats.recordDirectory(isEmpty);
        } else {
            m_stats.recordFile(sizeBytes, accessible);
        }
    } catch (const std::exception& e) {
        m_stats.recordError();
        {
            std::lock_guard<std::mutex> lock(m_resultsMutex);
            ++m_dropped;
        }
        FM_LOG(Error, kComponent, "Error processing " << domain::ToString(entry.kind) << " "
               << entry.path.string() << ": " << e.what());
    }
}

std::vector<domain::StructureItem> ParallelClassifier::takeResults() {
    std::lock_guard<std::mutex> lock(m_resultsMutex);
    std::vector<domain::StructureItem> out;
    out.swap(m_results);
    return out;
}

} // namespace foldermapper::application
