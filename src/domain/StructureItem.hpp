/**
 * @file StructureItem.hpp
 * @brief Domain entities describing one mapped filesystem entry and the walker's batches.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace foldermapper::domain {

/**
 * @enum ItemKind
 * @brief Kind of a mapped entry. Directories order before files.
 */
enum class ItemKind {
    Directory,
    File
};

inline const char* ToString(ItemKind kind) {
    return kind == ItemKind::Directory ? "directory" : "file";
}

/**
 * @struct FileDetails
 * @brief Attributes that only files carry.
 */
struct FileDetails {
    std::uint64_t sizeBytes = 0;
    std::optional<std::chrono::system_clock::time_point> modifiedTime;
    std::string extension;               ///< Lower-case, leading dot, empty when none.
    std::optional<std::string> mimeType;
};

/**
 * @struct DirectoryDetails
 * @brief Attributes that only directories carry.
 */
struct DirectoryDetails {
    std::size_t itemCount = 0;
    bool isEmpty = false;
};

/**
 * @class StructureItem
 * @brief One classified file or directory of the extracted tree.
 *
 * Created by the classifier from a walker entry and never modified afterwards.
 * relativePath is '/'-separated and unique across a run.
 */
class StructureItem {
public:
    ItemKind kind = ItemKind::File;
    std::string name;
    std::string relativePath;
    std::string description;
    int depth = 0;
    bool accessible = true;

    FileDetails file;           ///< Meaningful when kind == File.
    DirectoryDetails directory; ///< Meaningful when kind == Directory.

    bool isFile() const { return kind == ItemKind::File; }
    bool isDirectory() const { return kind == ItemKind::Directory; }

    /** @brief Relative path of the containing directory, empty for root entries. */
    std::string parentPath() const {
        auto pos = relativePath.rfind('/');
        return pos == std::string::npos ? std::string() : relativePath.substr(0, pos);
    }
};

/**
 * @struct WalkEntry
 * @brief (path, kind, depth) triple produced by the directory walker.
 */
struct WalkEntry {
    std::filesystem::path path;
    ItemKind kind = ItemKind::File;
    int depth = 0;
};

/** @brief Bounded group of entries handed to the classifier in one go. */
using Batch = std::vector<WalkEntry>;

} // namespace foldermapper::domain
