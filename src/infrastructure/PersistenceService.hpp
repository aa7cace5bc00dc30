/**
 * @file PersistenceService.hpp
 * @brief Atomic file output for the generated report artifacts.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace foldermapper::infrastructure {

/**
 * @class PersistenceService
 * @brief Writes whole documents through a temp file and a rename.
 *
 * Readers of the target path only ever see the previous file or the complete
 * new one, never a partial write.
 */
class PersistenceService {
public:
    /**
     * @brief Writes @p content to @p filename atomically (temp -> rename).
     * @return Error description on failure, std::nullopt on success.
     */
    std::optional<std::string> writeTextAtomic(const std::filesystem::path& filename,
                                               const std::string& content) const;
};

} // namespace foldermapper::infrastructure
