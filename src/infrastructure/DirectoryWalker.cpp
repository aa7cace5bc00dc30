/**
 * @file DirectoryWalker.cpp
 * @brief Implementation of DirectoryWalker.
 */

#include "infrastructure/DirectoryWalker.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/PathUtils.hpp"
#include <algorithm>
#include <stdexcept>

namespace foldermapper::infrastructure {

namespace fs = std::filesystem;

namespace {
const char* kComponent = "Walker";
}

DirectoryWalker::DirectoryWalker(fs::path root, int maxDepth, std::size_t chunkSize)
    : m_root(std::move(root)), m_maxDepth(maxDepth), m_chunkSize(chunkSize) {
    std::error_code ec;
    if (!fs::is_directory(m_root, ec)) {
        throw std::invalid_argument("Walk root is not a directory: " + m_root.string());
    }
    if (m_maxDepth < 0) {
        throw std::invalid_argument("maxDepth must not be negative");
    }
    if (m_chunkSize == 0) {
        throw std::invalid_argument("chunkSize must be at least 1");
    }
    m_pending.push_back({m_root, 0});
}

std::optional<domain::Batch> DirectoryWalker::nextBatch() {
    if (m_exhausted) return std::nullopt;

    domain::Batch batch;
    batch.reserve(std::min<std::size_t>(m_chunkSize, 4096));

    while (batch.size() < m_chunkSize) {
        if (!m_hasCurrent && !openNextDirectory()) {
            m_exhausted = true;
            break;
        }
        if (m_current == fs::directory_iterator()) {
            finishCurrentDirectory();
            continue;
        }

        const fs::directory_entry entry = *m_current;
        std::error_code statusEc;
        fs::file_status st = entry.symlink_status(statusEc);

        domain::WalkEntry walkEntry;
        walkEntry.path = entry.path();
        walkEntry.depth = m_currentLevel;
        walkEntry.kind = (!statusEc && fs::is_directory(st)) ? domain::ItemKind::Directory
                                                             : domain::ItemKind::File;
        if (walkEntry.kind == domain::ItemKind::Directory) {
            m_childDirectories.push_back(entry.path());
        }
        batch.push_back(std::move(walkEntry));

        std::error_code advanceEc;
        m_current.increment(advanceEc);
        if (advanceEc) {
            FM_LOG(Warn, kComponent, "Listing interrupted in "
                   << PathUtils::RelativeGeneric(entry.path().parent_path(), m_root) << ": " << advanceEc.message());
            finishCurrentDirectory();
        }
    }

    if (batch.empty()) return std::nullopt;
    m_entriesEmitted += batch.size();
    ++m_batchesEmitted;
    FM_LOG(Debug, kComponent, "Batch " << m_batchesEmitted << " with " << batch.size() << " entries");
    return batch;
}

bool DirectoryWalker::openNextDirectory() {
    while (!m_pending.empty()) {
        PendingDirectory next = std::move(m_pending.back());
        m_pending.pop_back();

        if (next.level > m_maxDepth) {
            ++m_skippedDirectories;
            FM_LOG(Warn, kComponent, "Maximum depth exceeded at: "
                   << PathUtils::RelativeGeneric(next.path, m_root) << " (depth " << next.level << ")");
            continue;
        }

        std::error_code ec;
        fs::directory_iterator it(next.path, ec);
        if (ec) {
            ++m_unreadableDirectories;
            FM_LOG(Debug, kComponent, "Cannot list "
                   << PathUtils::RelativeGeneric(next.path, m_root) << ": " << ec.message());
            continue;
        }

        m_current = std::move(it);
        m_currentLevel = next.level;
        m_hasCurrent = true;
        return true;
    }
    return false;
}

void DirectoryWalker::finishCurrentDirectory() {
    // Reverse so the first listed subdirectory is visited next.
    for (auto it = m_childDirectories.rbegin(); it != m_childDirectories.rend(); ++it) {
        m_pending.push_back({*it, m_currentLevel + 1});
    }
    m_childDirectories.clear();
    m_current = fs::directory_iterator();
    m_hasCurrent = false;
}

} // namespace foldermapper::infrastructure
