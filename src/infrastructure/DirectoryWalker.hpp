/**
 * @file DirectoryWalker.hpp
 * @brief Lazy, batched, depth-limited traversal of the extraction root.
 */

#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>
#include "domain/StructureItem.hpp"

namespace foldermapper::infrastructure {

/**
 * @class DirectoryWalker
 * @brief Produces Batches of (path, kind, depth) covering every entry below the root.
 *
 * Traversal is top-down and only materialises one batch at a time. Every batch
 * holds exactly chunkSize entries except possibly the last one. Once
 * nextBatch() has returned std::nullopt it keeps doing so; a walker cannot be
 * restarted.
 *
 * Directories whose depth exceeds maxDepth are not listed (a warning is
 * logged); the directory entry itself was already emitted by its parent.
 * Symlinks are reported as files and never followed.
 */
class DirectoryWalker {
public:
    /**
     * @throws std::invalid_argument if @p root is not a directory, @p maxDepth
     *         is negative or @p chunkSize is zero.
     */
    DirectoryWalker(std::filesystem::path root, int maxDepth, std::size_t chunkSize);

    /** @brief Next batch, or std::nullopt once the tree is exhausted. */
    std::optional<domain::Batch> nextBatch();

    const std::filesystem::path& root() const { return m_root; }

    /** @brief Directories not listed because they were deeper than maxDepth. */
    std::size_t skippedDirectories() const { return m_skippedDirectories; }
    /** @brief Directories whose listing failed (permissions, vanished). */
    std::size_t unreadableDirectories() const { return m_unreadableDirectories; }
    std::size_t entriesEmitted() const { return m_entriesEmitted; }
    std::size_t batchesEmitted() const { return m_batchesEmitted; }

private:
    struct PendingDirectory {
        std::filesystem::path path;
        int level;
    };

    bool openNextDirectory();
    void finishCurrentDirectory();

    std::filesystem::path m_root;
    int m_maxDepth;
    std::size_t m_chunkSize;

    std::vector<PendingDirectory> m_pending;
    std::filesystem::directory_iterator m_current;
    int m_currentLevel = 0;
    bool m_hasCurrent = false;
    std::vector<std::filesystem::path> m_childDirectories;
    bool m_exhausted = false;

    std::size_t m_skippedDirectories = 0;
    std::size_t m_unreadableDirectories = 0;
    std::size_t m_entriesEmitted = 0;
    std::size_t m_batchesEmitted = 0;
};

} // namespace foldermapper::infrastructure
