/**
 * @file JsonExportService.hpp
 * @brief JSON mirror of the mapping report.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "application/ReportRenderer.hpp"
#include "domain/ProcessingStats.hpp"
#include "domain/StructureItem.hpp"

namespace foldermapper::application {

class JsonExportService {
public:
    /**
     * @brief Builds {"metadata": {...}, "items": [...]}.
     *
     * Items are emitted in the same order as the detailed markdown listing.
     */
    static nlohmann::json ToJson(std::vector<domain::StructureItem> items,
                                 const domain::ProcessingStats& stats,
                                 const ReportContext& context);

    /** @brief ToJson() pretty-printed with a two space indent. */
    static std::string Render(std::vector<domain::StructureItem> items,
                              const domain::ProcessingStats& stats,
                              const ReportContext& context);

    static nlohmann::json ItemToJson(const domain::StructureItem& item);

    /** @brief Local time as "YYYY-MM-DDTHH:MM:SS". */
    static std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
};

} // namespace foldermapper::application
