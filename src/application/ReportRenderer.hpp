/**
 * @file ReportRenderer.hpp
 * @brief Deterministic markdown rendering of a completed mapping run.
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "domain/ProcessingStats.hpp"
#include "domain/StructureItem.hpp"

namespace foldermapper::application {

/**
 * @struct ReportContext
 * @brief Every time- or run-dependent value that appears in a report.
 */
struct ReportContext {
    std::string sourceName;
    std::string generatedAt;    ///< "YYYY-MM-DD HH:MM:SS"
    std::string processingTime; ///< Already formatted.
};

class ReportRenderer {
public:
    /**
     * @brief Renders the full report.
     *
     * Pure: identical items (in any order), stats and context always give
     * byte-identical output.
     */
    static std::string Render(std::vector<domain::StructureItem> items,
                              const domain::ProcessingStats& stats,
                              const ReportContext& context);

    /**
     * @brief Listing order: parent path, then directories before files, then
     *        relativePath, then kind.
     */
    static void SortForListing(std::vector<domain::StructureItem>& items);

    /** @brief (extension, count) over files with an extension; count desc, then name asc. */
    static std::vector<std::pair<std::string, std::size_t>> ExtensionHistogram(
        const std::vector<domain::StructureItem>& items);

    /** @brief 1234567 -> "1,234,567". */
    static std::string FormatCount(std::uint64_t value);

private:
    static void WriteHeader(std::string& out, const ReportContext& context);
    static void WriteSummary(std::string& out, const domain::ProcessingStats& stats);
    static void WriteDirectoryTree(std::string& out, const std::vector<domain::StructureItem>& items);
    static void WriteDetailedListings(std::string& out, const std::vector<domain::StructureItem>& items);
    static void WriteAppendix(std::string& out, const std::vector<domain::StructureItem>& items);
};

} // namespace foldermapper::application
