/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <fstream>

namespace foldermapper::infrastructure {

namespace fs = std::filesystem;

std::optional<std::string> PersistenceService::writeTextAtomic(const fs::path& filename,
                                                               const std::string& content) const {
    fs::path finalPath = filename;

    // filename.<timestamp>.tmp next to the target so the rename stays on one filesystem
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        return std::string("Error creating directories: ") + e.what();
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            return "Failed to open temp file: " + tempPath.string();
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            return "Write failed during output: " + tempPath.string();
        }
    }

    // 3. Atomic Rename
    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        return "Rename failed: " + ec.message();
    }
    return std::nullopt;
}

} // namespace foldermapper::infrastructure
