/**
 * @file MappingOrchestrator.cpp
 * @brief Implementation of MappingOrchestrator.
 */

#include "application/MappingOrchestrator.hpp"
#include "application/JsonExportService.hpp"
#include "application/ParallelClassifier.hpp"
#include "application/ReportRenderer.hpp"
#include "application/StatsAggregator.hpp"
#include "domain/DescriptionEngine.hpp"
#include "domain/MappingErrors.hpp"
#include "infrastructure/DirectoryWalker.hpp"
#include "infrastructure/FileSystemItemInspector.hpp"
#include "infrastructure/Logger.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>

namespace foldermapper::application {

namespace fs = std::filesystem;

namespace {

const char* kComponent = "Orchestrator";

std::string NowTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tmBuf{};
    localtime_r(&now, &tmBuf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmBuf);
    return buf;
}

std::string FormatSeconds(double seconds) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f seconds", seconds);
    return buf;
}

} // namespace

const char* ToString(RunState state) {
    switch (state) {
    case RunState::Idle:       return "Idle";
    case RunState::Extracting: return "Extracting";
    case RunState::Walking:    return "Walking";
    case RunState::Rendering:  return "Rendering";
    case RunState::Done:       return "Done";
    case RunState::Failed:     return "Failed";
    }
    return "Unknown";
}

MappingOrchestrator::MappingOrchestrator(domain::MappingOptions options,
                                         std::unique_ptr<domain::ArchiveExtractor> extractor,
                                         std::shared_ptr<infrastructure::PersistenceService> persistence)
    : m_options(std::move(options)),
      m_extractor(std::move(extractor)),
      m_persistence(std::move(persistence)) {}

void MappingOrchestrator::transition(RunState next) {
    FM_LOG(Debug, kComponent, ToString(m_state) << " -> " << ToString(next));
    m_state = next;
}

RunResult MappingOrchestrator::run() {
    RunResult result;
    const auto start = std::chrono::steady_clock::now();
    StatsAggregator stats;

    try {
        transition(RunState::Extracting);
        FM_LOG(Info, kComponent, "Extracting archive: " << m_options.archivePath);
        const fs::path root = m_extractor->extract(m_options.archivePath, m_workspace);

        transition(RunState::Walking);
        infrastructure::DirectoryWalker walker(root, m_options.maxDepth, m_options.chunkSize);
        domain::DescriptionEngine engine;
        infrastructure::FileSystemItemInspector inspector(root, engine);
        std::vector<domain::StructureItem> items;
        {
            ParallelClassifier classifier(inspector, stats, m_options.maxWorkers);
            items = classifier.classifyAll(walker);
        }
        result.skippedDirectories = walker.skippedDirectories();
        result.unreadableDirectories = walker.unreadableDirectories();
        if (result.unreadableDirectories > 0) {
            FM_LOG(Warn, kComponent, result.unreadableDirectories << " directories could not be listed");
        }
        result.stats = stats.snapshot();

        transition(RunState::Rendering);
        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        ReportRenderer::SortForListing(items);
        render(result, items, elapsed);
        result.items = std::move(items);

        transition(RunState::Done);
        result.exitCode = 0;
    } catch (const domain::ExtractionError& e) {
        FM_LOG(Error, kComponent, "Extraction failed: " << e.what());
        result.errorMessage = e.what();
    } catch (const domain::RenderError& e) {
        FM_LOG(Error, kComponent, "Report generation failed: " << e.what());
        result.errorMessage = e.what();
    } catch (const std::exception& e) {
        FM_LOG(Error, kComponent, "Mapping failed: " << e.what());
        result.errorMessage = e.what();
    }

    if (m_state != RunState::Done) {
        transition(RunState::Failed);
        result.stats = stats.snapshot();
        result.reportPath.clear();
        result.jsonPath.clear();
    }
    result.finalState = m_state;
    result.cleanupPerformed = cleanup();
    return result;
}

void MappingOrchestrator::render(RunResult& result, const std::vector<domain::StructureItem>& items,
                                 double elapsedSeconds) {
    ReportContext context;
    context.sourceName = fs::path(m_options.archivePath).filename().string();
    context.generatedAt = NowTimestamp();
    context.processingTime = FormatSeconds(elapsedSeconds);

    std::string report;
    try {
        report = ReportRenderer::Render(items, result.stats, context);
    } catch (const std::exception& e) {
        throw domain::RenderError(std::string("Cannot render report: ") + e.what());
    }
    if (auto error = m_persistence->writeTextAtomic(m_options.outputPath, report)) {
        throw domain::RenderError("Cannot write " + m_options.outputPath + ": " + *error);
    }
    result.reportPath = m_options.outputPath;
    FM_LOG(Info, kComponent, "Report written to " << m_options.outputPath);

    if (!m_options.jsonOutput) return;

    std::string document;
    try {
        document = JsonExportService::Render(items, result.stats, context);
    } catch (const std::exception& e) {
        throw domain::RenderError(std::string("Cannot serialize JSON mirror: ") + e.what());
    }
    if (auto error = m_persistence->writeTextAtomic(m_options.jsonPath, document)) {
        throw domain::RenderError("Cannot write " + m_options.jsonPath + ": " + *error);
    }
    result.jsonPath = m_options.jsonPath;
    FM_LOG(Info, kComponent, "JSON structure written to " << m_options.jsonPath);
}

bool MappingOrchestrator::cleanup() {
    if (!m_workspace) return false;
    const fs::path root = m_workspace->path();
    if (!m_workspace->remove()) return false;
    if (m_workspace->lastError()) {
        FM_LOG(Warn, kComponent, "Could not fully remove " << root.string() << ": "
               << m_workspace->lastError().message());
    } else {
        FM_LOG(Info, kComponent, "Cleaned up temporary directory: " << root.string());
    }
    return true;
}

} // namespace foldermapper::application
