/**
 * @file MappingOrchestrator.hpp
 * @brief Drives one mapping run: extract, walk and classify, render, clean up.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "domain/ArchiveExtractor.hpp"
#include "domain/MappingOptions.hpp"
#include "domain/ProcessingStats.hpp"
#include "domain/StructureItem.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace foldermapper::application {

/**
 * @enum RunState
 * @brief Idle -> Extracting -> Walking -> Rendering -> Done, Failed from any
 *        non-terminal state.
 */
enum class RunState {
    Idle,
    Extracting,
    Walking,
    Rendering,
    Done,
    Failed
};

const char* ToString(RunState state);

/**
 * @struct RunResult
 * @brief Everything a caller needs after run() returns.
 */
struct RunResult {
    RunState finalState = RunState::Idle;
    int exitCode = 1;
    domain::ProcessingStats stats;
    std::string reportPath;
    std::string jsonPath;      ///< Empty when JSON output was not requested.
    std::string errorMessage;  ///< Set when finalState == Failed.
    std::size_t skippedDirectories = 0;   ///< Not listed because deeper than maxDepth.
    std::size_t unreadableDirectories = 0; ///< Listing failed during the walk.
    std::vector<domain::StructureItem> items; ///< In listing order.
    bool cleanupPerformed = false;
};

class MappingOrchestrator {
public:
    MappingOrchestrator(domain::MappingOptions options,
                        std::unique_ptr<domain::ArchiveExtractor> extractor,
                        std::shared_ptr<infrastructure::PersistenceService> persistence);

    /**
     * @brief Runs the whole pipeline once.
     *
     * Never throws for run failures: extraction and render errors come back
     * as finalState == Failed with exitCode 1. The extraction root is removed
     * exactly once on every path.
     */
    RunResult run();

    RunState state() const { return m_state; }

private:
    void transition(RunState next);
    void render(RunResult& result, const std::vector<domain::StructureItem>& items,
                double elapsedSeconds);
    bool cleanup();

    domain::MappingOptions m_options;
    std::unique_ptr<domain::ArchiveExtractor> m_extractor;
    std::shared_ptr<infrastructure::PersistenceService> m_persistence;
    std::unique_ptr<domain::TemporaryDirectory> m_workspace;
    RunState m_state = RunState::Idle;
};

} // namespace foldermapper::application
