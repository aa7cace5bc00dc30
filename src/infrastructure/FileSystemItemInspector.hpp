/**
 * @file FileSystemItemInspector.hpp
 * @brief Turns one walker entry into a described StructureItem.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "domain/DescriptionEngine.hpp"
#include "domain/StructureItem.hpp"

namespace foldermapper::infrastructure {

/**
 * @class FileSystemItemInspector
 * @brief Infrastructure adapter that stats an entry, gathers the facts the
 *        DescriptionEngine needs and builds the resulting item.
 */
class FileSystemItemInspector {
public:
    /**
     * @struct Inspection
     * @brief Inspected item plus whether access was refused on the way.
     */
    struct Inspection {
        domain::StructureItem item;
        bool permissionDenied = false;
    };

    FileSystemItemInspector(std::filesystem::path root, const domain::DescriptionEngine& engine);

    /**
     * @brief Inspects @p entry.
     *
     * Permission failures never throw: the item comes back with
     * accessible=false and permissionDenied=true.
     *
     * @throws domain::ClassificationError for any other failure.
     */
    Inspection inspect(const domain::WalkEntry& entry) const;

    /** @brief Reads at most DescriptionEngine::kPreviewBytes; std::nullopt on any failure. */
    static std::optional<std::string> ReadPreview(const std::filesystem::path& path);

    static std::string LowerExtension(const std::filesystem::path& path);

private:
    Inspection inspectFile(const domain::WalkEntry& entry) const;
    Inspection inspectDirectory(const domain::WalkEntry& entry) const;

    std::filesystem::path m_root;
    const domain::DescriptionEngine& m_engine;
};

} // namespace foldermapper::infrastructure
