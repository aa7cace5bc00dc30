/**
 * @file ArchiveExtractor.hpp
 * @brief Interface for unpacking the input archive into a temporary working tree.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

namespace foldermapper::domain {

/**
 * @class TemporaryDirectory
 * @brief Owns a temporary directory and removes it exactly once.
 *
 * Removal happens on the first call to remove() or in the destructor,
 * whichever comes first.
 */
class TemporaryDirectory {
public:
    explicit TemporaryDirectory(std::filesystem::path path) : m_path(std::move(path)) {}
    ~TemporaryDirectory() { remove(); }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    bool removed() const { return m_removed; }

    /**
     * @brief Deletes the directory tree.
     * @return true when this call performed the removal.
     */
    bool remove() {
        if (m_removed) return false;
        m_removed = true;
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
        m_lastError = ec;
        return true;
    }

    /** @brief Error reported by the removal, if any. */
    std::error_code lastError() const { return m_lastError; }

private:
    std::filesystem::path m_path;
    bool m_removed = false;
    std::error_code m_lastError;
};

/**
 * @class ArchiveExtractor
 * @brief Abstract interface for archive back-ends.
 */
class ArchiveExtractor {
public:
    virtual ~ArchiveExtractor() = default;

    /**
     * @brief Creates a fresh temporary root and unpacks the archive into it.
     *
     * The returned handle is stored in @p workspace before any content is
     * written, so the caller can clean up even when this method throws.
     *
     * @param archivePath Compressed input file.
     * @param workspace Receives the temporary root handle.
     * @return The extraction root.
     * @throws ExtractionError when the input is missing or unreadable.
     */
    virtual std::filesystem::path extract(const std::filesystem::path& archivePath,
                                          std::unique_ptr<TemporaryDirectory>& workspace) = 0;
};

} // namespace foldermapper::domain
