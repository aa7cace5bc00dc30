/**
 * @file DescriptionEngine.hpp
 * @brief Heuristic classifier that writes a human-readable description for each entry.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace foldermapper::domain {

/**
 * @struct DirectoryFacts
 * @brief Everything the engine needs to know about a directory.
 */
struct DirectoryFacts {
    std::string name;
    bool accessible = true;
    std::size_t entryCount = 0;
    std::size_t fileCount = 0;
    std::size_t dirCount = 0;
    std::map<std::string, std::size_t> extensionCounts; ///< Lower-case extension of each child file.
};

/**
 * @struct FileFacts
 * @brief Everything the engine needs to know about a file.
 */
struct FileFacts {
    std::string name;
    std::string extension; ///< Lower-case, leading dot.
    std::uint64_t sizeBytes = 0;
    bool accessible = true;
    std::optional<std::string> preview; ///< First bytes of text-like files, when readable.
};

/**
 * @struct DescriptionRule
 * @brief One (predicate, description-builder) pair of a priority list.
 */
template <typename Facts>
struct DescriptionRule {
    std::string id;
    std::function<bool(const Facts&)> matches;
    std::function<std::string(const Facts&)> build;
};

/**
 * @class DescriptionEngine
 * @brief Pure function from entry facts to a description.
 *
 * Both chains are ordered rule lists evaluated top to bottom; the first rule
 * whose predicate matches builds the description. The last rule of each
 * chain always matches.
 */
class DescriptionEngine {
public:
    /** @brief Number of bytes read from text-like files for content hints. */
    static constexpr std::size_t kPreviewBytes = 500;

    DescriptionEngine();

    std::string describeDirectory(const DirectoryFacts& facts) const;
    std::string describeFile(const FileFacts& facts) const;

    /** @brief Id of the directory rule that would fire, for diagnostics and tests. */
    std::string matchingDirectoryRule(const DirectoryFacts& facts) const;
    /** @brief Id of the file rule that would fire, for diagnostics and tests. */
    std::string matchingFileRule(const FileFacts& facts) const;

    const std::vector<DescriptionRule<DirectoryFacts>>& directoryRules() const { return m_directoryRules; }
    const std::vector<DescriptionRule<FileFacts>>& fileRules() const { return m_fileRules; }

    /** @brief True for extensions whose content may refine the description. */
    static bool WantsPreview(const std::string& extension);

    /** @brief Human size with one decimal place ("2.0 KB"). */
    static std::string FormatSize(std::uint64_t bytes);

    /** @brief "small" below 1 KiB, "medium" below 1 MiB, "large" otherwise. */
    static const char* SizeBucket(std::uint64_t bytes);

    /** @brief Most frequent extension; ties go to the alphabetically smallest. */
    static std::string DominantExtension(const std::map<std::string, std::size_t>& counts);

    /** @brief Short hint derived from the preview, empty when nothing matches. */
    static std::string ContentHint(const FileFacts& facts);

    static std::string ToLower(std::string value);

private:
    void buildDirectoryRules();
    void buildFileRules();

    std::vector<DescriptionRule<DirectoryFacts>> m_directoryRules;
    std::vector<DescriptionRule<FileFacts>> m_fileRules;
};

} // namespace foldermapper::domain
