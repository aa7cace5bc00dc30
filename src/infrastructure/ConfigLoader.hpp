/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading mapper defaults from settings.json.
 *
 * Keeps the JSON parsing in one place; callers only see MappingOptions.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "domain/MappingOptions.hpp"

namespace foldermapper::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Default settings location: $XDG_CONFIG_HOME/FolderMapper/settings.json.
     */
    static std::filesystem::path DefaultSettingsPath();

    /**
     * @brief Overlays the keys found in @p settingsPath onto @p options.
     *
     * Recognized keys: max_depth, max_workers, chunk_size, output, json_output,
     * json_path, log_directory, verbose. Unknown keys are ignored. A missing
     * file leaves @p options untouched; a malformed file or a key with the
     * wrong type is reported and skipped. Numeric keys outside their range
     * (max_depth 0..INT_MAX, max_workers 1..kMaxWorkerLimit, chunk_size
     * 1..kMaxChunkSize) are reported and keep their previous value.
     *
     * @return Problems found while reading, empty when the file was applied cleanly.
     */
    static std::optional<std::string> ApplySettings(const std::filesystem::path& settingsPath,
                                                    domain::MappingOptions& options);
};

} // namespace foldermapper::infrastructure
