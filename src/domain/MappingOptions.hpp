/**
 * @file MappingOptions.hpp
 * @brief Tunables of a mapping run, filled from defaults, the settings file and the CLI.
 */

#pragma once
#include <cstddef>
#include <string>

namespace foldermapper::domain {

/** @brief Upper bounds accepted from the settings file and the command line. */
constexpr std::size_t kMaxWorkerLimit = 1024;
constexpr std::size_t kMaxChunkSize = 10000000;

struct MappingOptions {
    std::string archivePath;
    std::string outputPath = "folder_mapping.md";
    int maxDepth = 100;
    std::size_t maxWorkers = 8;
    std::size_t chunkSize = 5000;

    bool jsonOutput = false;
    std::string jsonPath = "folder_structure.json";

    std::string logDirectory = ".";
    bool verbose = false;
};

} // namespace foldermapper::domain
