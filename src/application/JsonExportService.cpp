#include "application/JsonExportService.hpp"
#include "domain/DescriptionEngine.hpp"
#include <ctime>

namespace foldermapper::application {

using nlohmann::json;

json JsonExportService::ToJson(std::vector<domain::StructureItem> items,
                               const domain::ProcessingStats& stats,
                               const ReportContext& context) {
    ReportRenderer::SortForListing(items);

    json fileStats = json::object();
    for (const auto& [ext, count] : ReportRenderer::ExtensionHistogram(items)) {
        fileStats[ext] = count;
    }

    json j;
    j["metadata"] = {
        {"generated_at", context.generatedAt},
        {"source_file", context.sourceName},
        {"processing_time", context.processingTime},
        {"statistics", {
            {"processed_files", stats.processedFiles},
            {"processed_folders", stats.processedFolders},
            {"errors_encountered", stats.errorsEncountered},
            {"permission_denials", stats.permissionDenials},
            {"large_files", stats.largeFiles},
            {"empty_directories", stats.emptyDirectories},
            {"total_size", stats.totalSizeBytes},
            {"total_size_human", domain::DescriptionEngine::FormatSize(stats.totalSizeBytes)}
        }},
        {"file_statistics", fileStats}
    };

    json array = json::array();
    for (const auto& item : items) {
        array.push_back(ItemToJson(item));
    }
    j["items"] = std::move(array);
    return j;
}

std::string JsonExportService::Render(std::vector<domain::StructureItem> items,
                                      const domain::ProcessingStats& stats,
                                      const ReportContext& context) {
    return ToJson(std::move(items), stats, context).dump(2);
}

json JsonExportService::ItemToJson(const domain::StructureItem& item) {
    json j;
    j["type"] = domain::ToString(item.kind);
    j["name"] = item.name;
    j["path"] = item.relativePath;
    j["description"] = item.description;
    j["level"] = item.depth;
    j["is_accessible"] = item.accessible;

    if (item.isFile()) {
        j["size"] = item.file.sizeBytes;
        j["size_human"] = domain::DescriptionEngine::FormatSize(item.file.sizeBytes);
        if (item.file.modifiedTime) {
            j["modified"] = FormatTimestamp(*item.file.modifiedTime);
        } else {
            j["modified"] = nullptr;
        }
        j["extension"] = item.file.extension;
        if (item.file.mimeType) {
            j["mime_type"] = *item.file.mimeType;
        } else {
            j["mime_type"] = nullptr;
        }
    } else {
        j["item_count"] = item.directory.itemCount;
        j["is_empty"] = item.directory.isEmpty;
    }
    return j;
}

std::string JsonExportService::FormatTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tmBuf{};
    localtime_r(&tt, &tmBuf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tmBuf);
    return buf;
}

} // namespace foldermapper::application
