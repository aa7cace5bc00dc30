#include "application/ReportRenderer.hpp"
#include "domain/DescriptionEngine.hpp"
#include <algorithm>
#include <map>
#include <sstream>
#include <tuple>

namespace foldermapper::application {

using domain::ItemKind;
using domain::StructureItem;

std::string ReportRenderer::Render(std::vector<StructureItem> items,
                                   const domain::ProcessingStats& stats,
                                   const ReportContext& context) {
    SortForListing(items);

    std::string out;
    out.reserve(256 + items.size() * 200);
    WriteHeader(out, context);
    WriteSummary(out, stats);
    WriteDirectoryTree(out, items);
    WriteDetailedListings(out, items);
    WriteAppendix(out, items);
    return out;
}

void ReportRenderer::SortForListing(std::vector<StructureItem>& items) {
    std::sort(items.begin(), items.end(), [](const StructureItem& a, const StructureItem& b) {
        const std::string pa = a.parentPath();
        const std::string pb = b.parentPath();
        return std::tie(pa, a.kind, a.relativePath) < std::tie(pb, b.kind, b.relativePath);
    });
}

std::vector<std::pair<std::string, std::size_t>> ReportRenderer::ExtensionHistogram(
    const std::vector<StructureItem>& items) {
    std::map<std::string, std::size_t> counts;
    for (const auto& item : items) {
        if (item.isFile() && !item.file.extension.empty()) {
            ++counts[item.file.extension];
        }
    }
    std::vector<std::pair<std::string, std::size_t>> histogram(counts.begin(), counts.end());
    std::stable_sort(histogram.begin(), histogram.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });
    return histogram;
}

std::string ReportRenderer::FormatCount(std::uint64_t value) {
    std::string digits = std::to_string(value);
    std::string out;
    int n = static_cast<int>(digits.size());
    for (int i = 0; i < n; ++i) {
        out += digits[i];
        int remaining = n - i - 1;
        if (remaining > 0 && remaining % 3 == 0) out += ',';
    }
    return out;
}

void ReportRenderer::WriteHeader(std::string& out, const ReportContext& context) {
    out += "# Comprehensive Folder Mapping Report\n\n";
    out += "**Generated:** " + context.generatedAt + "\n";
    out += "**Source:** " + context.sourceName + "\n";
    out += "**Processing Time:** " + context.processingTime + "\n\n";
    out += "---\n\n";
}

void ReportRenderer::WriteSummary(std::string& out, const domain::ProcessingStats& stats) {
    out += "## Summary Statistics\n\n";
    out += "- **Total Files:** " + FormatCount(stats.processedFiles) + "\n";
    out += "- **Total Folders:** " + FormatCount(stats.processedFolders) + "\n";
    out += "- **Total Size:** " + domain::DescriptionEngine::FormatSize(stats.totalSizeBytes) + "\n";
    out += "- **Large Files (>100MB):** " + FormatCount(stats.largeFiles) + "\n";
    out += "- **Empty Directories:** " + FormatCount(stats.emptyDirectories) + "\n";
    out += "- **Permission Denials:** " + FormatCount(stats.permissionDenials) + "\n";
    out += "- **Processing Errors:** " + FormatCount(stats.errorsEncountered) + "\n\n";
    out += "---\n\n";
}

void ReportRenderer::WriteDirectoryTree(std::string& out, const std::vector<StructureItem>& items) {
    std::vector<const StructureItem*> directories;
    for (const auto& item : items) {
        if (item.isDirectory()) directories.push_back(&item);
    }
    std::sort(directories.begin(), directories.end(), [](const StructureItem* a, const StructureItem* b) {
        return a->relativePath < b->relativePath;
    });

    out += "## Directory Structure Tree\n\n";
    out += "```\n";
    for (const auto* dir : directories) {
        // Indentation comes from the recorded depth, not from the path.
        out += std::string(static_cast<std::size_t>(dir->depth) * 2, ' ');
        out += "\xF0\x9F\x93\x81 " + dir->name + "/\n";
    }
    out += "```\n\n";
    out += "---\n\n";
}

void ReportRenderer::WriteDetailedListings(std::string& out, const std::vector<StructureItem>& items) {
    out += "## Detailed File and Folder Listings\n\n";

    bool first = true;
    std::string currentParent;
    for (const auto& item : items) {
        const std::string parent = item.parentPath();
        if (first || parent != currentParent) {
            first = false;
            currentParent = parent;
            if (parent.empty()) {
                out += "### Root Directory\n\n";
            } else {
                out += "### Directory: `" + parent + "`\n\n";
            }
        }

        const char* icon = item.isDirectory() ? "\xF0\x9F\x93\x81" : "\xF0\x9F\x93\x84";
        out += std::string("**") + icon + " " + item.name + "**\n";
        out += "- **Path:** `" + item.relativePath + "`\n";
        out += std::string("- **Type:** ") + (item.isDirectory() ? "Directory" : "File") + "\n";
        out += "- **Description:** " + item.description + "\n";

        if (item.isFile()) {
            out += "- **Size:** " + domain::DescriptionEngine::FormatSize(item.file.sizeBytes) + "\n";
            if (item.file.mimeType) {
                out += "- **MIME Type:** " + *item.file.mimeType + "\n";
            }
            if (!item.file.extension.empty()) {
                out += "- **Extension:** " + item.file.extension + "\n";
            }
        } else {
            out += "- **Items:** " + std::to_string(item.directory.itemCount) + "\n";
            out += std::string("- **Status:** ") + (item.accessible ? "Accessible" : "Restricted") + "\n";
        }
        out += "\n";
    }
    out += "---\n\n";
}

void ReportRenderer::WriteAppendix(std::string& out, const std::vector<StructureItem>& items) {
    out += "## Appendix\n\n";
    out += "### File Extensions Summary\n\n";
    for (const auto& [ext, count] : ExtensionHistogram(items)) {
        out += "- **" + ext + ":** " + FormatCount(count) + " files\n";
    }
    out += "\n";
    out += "### Processing Log\n\n";
    out += "For detailed processing information, see the log file generated alongside this report.\n\n";
    out += "---\n\n";
    out += "*Report generated by Comprehensive Folder Mapper*\n";
}

} // namespace foldermapper::application
