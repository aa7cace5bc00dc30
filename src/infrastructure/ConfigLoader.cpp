/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cstdint>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>

namespace foldermapper::infrastructure {

namespace fs = std::filesystem;

namespace {

void AddProblem(std::string& problems, const std::string& problem) {
    problems += std::string(problems.empty() ? "" : "; ") + problem;
}

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target, std::string& problems) {
    if (!j.contains(key)) return;
    try {
        target = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        AddProblem(problems, std::string("'") + key + "': " + e.what());
    }
}

// Integers are read as signed 64-bit so negative values cannot wrap into huge unsigned ones.
template <typename T>
void ReadBoundedInteger(const nlohmann::json& j, const char* key, std::int64_t minimum,
                        std::int64_t maximum, T& target, std::string& problems) {
    if (!j.contains(key)) return;
    const nlohmann::json& value = j.at(key);
    if (!value.is_number_integer()) {
        AddProblem(problems, std::string("'") + key + "' must be an integer");
        return;
    }
    if (value.is_number_unsigned() && value.get<std::uint64_t>() > static_cast<std::uint64_t>(maximum)) {
        AddProblem(problems, std::string("'") + key + "' must be at most " + std::to_string(maximum));
        return;
    }
    const std::int64_t number = value.get<std::int64_t>();
    if (number < minimum || number > maximum) {
        AddProblem(problems, std::string("'") + key + "' must be between " + std::to_string(minimum) +
                             " and " + std::to_string(maximum));
        return;
    }
    target = static_cast<T>(number);
}

} // namespace

fs::path ConfigLoader::DefaultSettingsPath() {
    return PathUtils::GetConfigHome() / "FolderMapper" / "settings.json";
}

std::optional<std::string> ConfigLoader::ApplySettings(const fs::path& settingsPath,
                                                       domain::MappingOptions& options) {
    std::error_code ec;
    if (!fs::exists(settingsPath, ec)) {
        return std::nullopt;
    }

    nlohmann::json j;
    try {
        std::ifstream f(settingsPath);
        f >> j;
    } catch (const std::exception& e) {
        return std::string("Error reading ") + settingsPath.string() + ": " + e.what();
    }
    if (!j.is_object()) {
        return settingsPath.string() + " does not contain a JSON object";
    }

    domain::MappingOptions merged = options;
    std::string problems;
    ReadBoundedInteger(j, "max_depth", 0, std::numeric_limits<int>::max(), merged.maxDepth, problems);
    ReadBoundedInteger(j, "max_workers", 1, static_cast<std::int64_t>(domain::kMaxWorkerLimit),
                       merged.maxWorkers, problems);
    ReadBoundedInteger(j, "chunk_size", 1, static_cast<std::int64_t>(domain::kMaxChunkSize),
                       merged.chunkSize, problems);
    ReadKey(j, "output", merged.outputPath, problems);
    ReadKey(j, "json_output", merged.jsonOutput, problems);
    ReadKey(j, "json_path", merged.jsonPath, problems);
    ReadKey(j, "log_directory", merged.logDirectory, problems);
    ReadKey(j, "verbose", merged.verbose, problems);

    options = merged;
    if (problems.empty()) return std::nullopt;
    return problems;
}

} // namespace foldermapper::infrastructure
