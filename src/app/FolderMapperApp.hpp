/**
 * @file FolderMapperApp.hpp
 * @brief Command line front end of FolderMapper.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include "domain/MappingOptions.hpp"

namespace foldermapper::app {

/**
 * @struct CommandLine
 * @brief Values given explicitly on the command line; unset flags stay empty
 *        so they do not override the settings file.
 */
struct CommandLine {
    std::optional<std::string> archivePath;
    std::optional<std::string> outputPath;
    std::optional<int> maxDepth;
    std::optional<std::size_t> maxWorkers;
    std::optional<std::size_t> chunkSize;
    std::optional<bool> jsonOutput;
    std::optional<std::string> jsonPath;
    std::optional<std::string> configPath;
    std::optional<std::string> logDirectory;
    std::optional<bool> verbose;

    bool showHelp = false;
    std::string error; ///< Non-empty when parsing failed.
};

/**
 * @class FolderMapperApp
 * @brief Parses arguments, resolves options, runs one mapping and reports the outcome.
 */
class FolderMapperApp {
public:
    /**
     * @brief Entry point used by main().
     * @return Process exit code (0 on success, 1 on any failure).
     */
    int Run(int argc, char** argv);

    /** @brief getopt_long based parser. Safe to call more than once per process. */
    static CommandLine ParseCommandLine(int argc, char** argv);

    /**
     * @brief Applies defaults, then the settings file, then the explicit flags.
     * @param configProblems Receives settings file problems, if any.
     */
    static domain::MappingOptions ResolveOptions(const CommandLine& cli,
                                                 std::optional<std::string>& configProblems);

    static std::string Usage(const char* program);
};

} // namespace foldermapper::app
