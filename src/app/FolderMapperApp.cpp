/**
 * @file FolderMapperApp.cpp
 * @brief Implementation of the FolderMapperApp class.
 */
#include "app/FolderMapperApp.hpp"

#include <getopt.h>

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <sstream>

#include "application/MappingOrchestrator.hpp"
#include "application/ReportRenderer.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/LibArchiveExtractor.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace foldermapper::app {

namespace {

const char* kComponent = "App";

enum LongOnlyOption {
    kOptMaxDepth = 1000,
    kOptMaxWorkers,
    kOptChunkSize,
    kOptJsonPath,
    kOptLogDir
};

bool ParseNumber(const char* text, long long minimum, long long maximum, long long& value) {
    if (text == nullptr || *text == '\0') return false;
    char* end = nullptr;
    errno = 0;
    long long parsed = std::strtoll(text, &end, 10);
    if (errno != 0 || *end != '\0' || parsed < minimum || parsed > maximum) return false;
    value = parsed;
    return true;
}

} // namespace

std::string FolderMapperApp::Usage(const char* program) {
    std::ostringstream ss;
    ss << "Usage: " << program << " [options] <archive_path>\n\n"
       << "Map the contents of a compressed archive into a markdown report.\n\n"
       << "Options:\n"
       << "  -o, --output <file>     Markdown report path (default: folder_mapping.md)\n"
       << "      --max-depth <n>     Deepest directory whose children are listed (default: 100)\n"
       << "      --max-workers <n>   Worker threads (default: 8)\n"
       << "      --chunk-size <n>    Entries per batch (default: 5000)\n"
       << "  -j, --json              Also write the JSON structure\n"
       << "      --json-path <file>  JSON structure path (default: folder_structure.json)\n"
       << "  -c, --config <file>     Settings file (default: "
       << infrastructure::ConfigLoader::DefaultSettingsPath().string() << ")\n"
       << "      --log-dir <dir>     Directory for the run log (default: .)\n"
       << "  -v, --verbose           Debug logging\n"
       << "  -h, --help              Show this help\n";
    return ss.str();
}

CommandLine FolderMapperApp::ParseCommandLine(int argc, char** argv) {
    static struct option longOptions[] = {
        {"output", required_argument, nullptr, 'o'},
        {"max-depth", required_argument, nullptr, kOptMaxDepth},
        {"max-workers", required_argument, nullptr, kOptMaxWorkers},
        {"chunk-size", required_argument, nullptr, kOptChunkSize},
        {"json", no_argument, nullptr, 'j'},
        {"json-path", required_argument, nullptr, kOptJsonPath},
        {"config", required_argument, nullptr, 'c'},
        {"log-dir", required_argument, nullptr, kOptLogDir},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    CommandLine cli;
    optind = 0; // full getopt reset, so repeated parses start clean
    opterr = 0;

    int c;
    int optionIndex = 0;
    long long number = 0;
    while ((c = getopt_long(argc, argv, "o:jc:vh", longOptions, &optionIndex)) != -1) {
        switch (c) {
        case 'o':
            cli.outputPath = optarg;
            break;
        case kOptMaxDepth:
            if (!ParseNumber(optarg, 0, std::numeric_limits<int>::max(), number)) {
                cli.error = std::string("--max-depth expects an integer in [0, ") +
                            std::to_string(std::numeric_limits<int>::max()) + "], got '" + optarg + "'";
                return cli;
            }
            cli.maxDepth = static_cast<int>(number);
            break;
        case kOptMaxWorkers:
            if (!ParseNumber(optarg, 1, static_cast<long long>(domain::kMaxWorkerLimit), number)) {
                cli.error = std::string("--max-workers expects an integer in [1, ") +
                            std::to_string(domain::kMaxWorkerLimit) + "], got '" + optarg + "'";
                return cli;
            }
            cli.maxWorkers = static_cast<std::size_t>(number);
            break;
        case kOptChunkSize:
            if (!ParseNumber(optarg, 1, static_cast<long long>(domain::kMaxChunkSize), number)) {
                cli.error = std::string("--chunk-size expects an integer in [1, ") +
                            std::to_string(domain::kMaxChunkSize) + "], got '" + optarg + "'";
                return cli;
            }
            cli.chunkSize = static_cast<std::size_t>(number);
            break;
        case 'j':
            cli.jsonOutput = true;
            break;
        case kOptJsonPath:
            cli.jsonPath = optarg;
            break;
        case 'c':
            cli.configPath = optarg;
            break;
        case kOptLogDir:
            cli.logDirectory = optarg;
            break;
        case 'v':
            cli.verbose = true;
            break;
        case 'h':
            cli.showHelp = true;
            return cli;
        case '?':
        default:
            if (optopt != 0) {
                cli.error = std::string("unknown or incomplete option '-") + static_cast<char>(optopt) + "'";
            } else {
                cli.error = std::string("unknown or incomplete option '") + argv[optind - 1] + "'";
            }
            return cli;
        }
    }

    if (optind < argc) {
        cli.archivePath = argv[optind++];
    }
    if (optind < argc) {
        cli.error = std::string("unexpected argument '") + argv[optind] + "'";
    }
    return cli;
}

domain::MappingOptions FolderMapperApp::ResolveOptions(const CommandLine& cli,
                                                       std::optional<std::string>& configProblems) {
    domain::MappingOptions options;

    const std::filesystem::path settingsPath = cli.configPath
        ? std::filesystem::path(*cli.configPath)
        : infrastructure::ConfigLoader::DefaultSettingsPath();
    configProblems = infrastructure::ConfigLoader::ApplySettings(settingsPath, options);

    if (cli.archivePath) options.archivePath = *cli.archivePath;
    if (cli.outputPath) options.outputPath = *cli.outputPath;
    if (cli.maxDepth) options.maxDepth = *cli.maxDepth;
    if (cli.maxWorkers) options.maxWorkers = *cli.maxWorkers;
    if (cli.chunkSize) options.chunkSize = *cli.chunkSize;
    if (cli.jsonOutput) options.jsonOutput = *cli.jsonOutput;
    if (cli.jsonPath) options.jsonPath = *cli.jsonPath;
    if (cli.logDirectory) options.logDirectory = *cli.logDirectory;
    if (cli.verbose) options.verbose = *cli.verbose;
    return options;
}

int FolderMapperApp::Run(int argc, char** argv) {
    const char* program = argc > 0 ? argv[0] : "folder_mapper";
    CommandLine cli = ParseCommandLine(argc, argv);
    if (cli.showHelp) {
        std::cout << Usage(program);
        return 0;
    }
    if (!cli.error.empty()) {
        std::cerr << "Error: " << cli.error << "\n\n" << Usage(program);
        return 1;
    }
    if (!cli.archivePath) {
        std::cerr << "Error: missing <archive_path>\n\n" << Usage(program);
        return 1;
    }

    std::optional<std::string> configProblems;
    domain::MappingOptions options = ResolveOptions(cli, configProblems);

    auto& logger = infrastructure::Logger::Instance();
    logger.setMinLevel(options.verbose ? infrastructure::LogLevel::Debug : infrastructure::LogLevel::Info);
    const auto logPath = logger.openRunLog(options.logDirectory);
    if (!logPath.empty()) {
        FM_LOG(Info, kComponent, "Logging to " << logPath.string());
    }
    if (configProblems) {
        FM_LOG(Warn, kComponent, "Settings file problems, using defaults where needed: " << *configProblems);
    }

    std::error_code ec;
    if (!std::filesystem::exists(options.archivePath, ec)) {
        FM_LOG(Error, kComponent, "Archive file not found: " << options.archivePath);
        logger.closeFile();
        return 1;
    }

    FM_LOG(Info, kComponent, "Starting comprehensive folder mapping");
    FM_LOG(Info, kComponent, "Archive: " << options.archivePath);
    FM_LOG(Info, kComponent, "Output: " << options.outputPath);
    FM_LOG(Debug, kComponent, "max_depth=" << options.maxDepth << " max_workers=" << options.maxWorkers
           << " chunk_size=" << options.chunkSize);

    application::MappingOrchestrator orchestrator(
        options,
        std::make_unique<infrastructure::LibArchiveExtractor>(),
        std::make_shared<infrastructure::PersistenceService>());
    application::RunResult result = orchestrator.run();

    using application::ReportRenderer;
    if (result.finalState == application::RunState::Done) {
        std::cout << "\nFolder mapping completed successfully!\n"
                  << "Report saved to: " << result.reportPath << "\n";
        if (!result.jsonPath.empty()) {
            std::cout << "JSON structure saved to: " << result.jsonPath << "\n";
        }
        std::cout << "Processed " << ReportRenderer::FormatCount(result.stats.processedFiles) << " files and "
                  << ReportRenderer::FormatCount(result.stats.processedFolders) << " folders\n";
        if (result.skippedDirectories > 0 || result.unreadableDirectories > 0) {
            std::cout << "Directories not listed: " << result.skippedDirectories << " beyond max depth, "
                      << result.unreadableDirectories << " unreadable\n";
        }
        if (result.stats.errorsEncountered > 0 || result.stats.permissionDenials > 0) {
            std::cout << "Errors: " << result.stats.errorsEncountered
                      << ", permission denials: " << result.stats.permissionDenials << "\n";
        }
    } else {
        FM_LOG(Error, kComponent, "Mapping failed: " << result.errorMessage << " (files="
               << result.stats.processedFiles << ", folders=" << result.stats.processedFolders
               << ", errors=" << result.stats.errorsEncountered << ")");
    }

    logger.closeFile();
    return result.exitCode;
}

} // namespace foldermapper::app
