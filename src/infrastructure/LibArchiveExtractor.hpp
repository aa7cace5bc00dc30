/**
 * @file LibArchiveExtractor.hpp
 * @brief libarchive based implementation of the ArchiveExtractor interface.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "domain/ArchiveExtractor.hpp"

namespace foldermapper::infrastructure {

/**
 * @class LibArchiveExtractor
 * @brief Unpacks zip, tar(.gz/.bz2/.xz), 7z and rar inputs and one level of nested archives.
 */
class LibArchiveExtractor : public domain::ArchiveExtractor {
public:
    /**
     * @param tempBase Directory under which "folder_mapper_XXXXXX" roots are created.
     */
    explicit LibArchiveExtractor(std::filesystem::path tempBase = std::filesystem::temp_directory_path());

    std::filesystem::path extract(const std::filesystem::path& archivePath,
                                  std::unique_ptr<domain::TemporaryDirectory>& workspace) override;

    /** @brief Nested archives expanded by the last extract() call. */
    std::size_t nestedExtracted() const { return m_nestedExtracted; }
    /** @brief Nested archives that failed to expand in the last extract() call. */
    std::size_t nestedFailed() const { return m_nestedFailed; }

    /**
     * @brief Unpacks @p archivePath into the existing directory @p destination.
     * @return Number of entries written.
     * @throws domain::ExtractionError when the archive cannot be read.
     */
    static std::size_t ExtractInto(const std::filesystem::path& archivePath,
                                   const std::filesystem::path& destination);

    /**
     * @brief Stem used for the "<stem>_extracted" sibling of a nested archive.
     * @return std::nullopt when @p filename has no nested-archive suffix
     *         (.zip, .tar.gz, .rar, .7z; case-insensitive).
     */
    static std::optional<std::string> NestedArchiveStem(const std::string& filename);

private:
    std::filesystem::path createWorkspace() const;
    void processNestedArchives(const std::filesystem::path& root);

    std::filesystem::path m_tempBase;
    std::size_t m_nestedExtracted = 0;
    std::size_t m_nestedFailed = 0;
};

} // namespace foldermapper::infrastructure
