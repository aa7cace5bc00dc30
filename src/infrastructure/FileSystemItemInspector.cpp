/**
 * @file FileSystemItemInspector.cpp
 * @brief Implementation of the FileSystemItemInspector.
 */

#include "infrastructure/FileSystemItemInspector.hpp"
#include "domain/MappingErrors.hpp"
#include "infrastructure/MimeTypes.hpp"
#include "infrastructure/PathUtils.hpp"

#include <sys/stat.h>

#include <fstream>
#include <system_error>

namespace foldermapper::infrastructure {

namespace fs = std::filesystem;

namespace {

bool IsPermissionError(const std::error_code& ec) {
    return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
}

domain::StructureItem BaseItem(const domain::WalkEntry& entry, const fs::path& root) {
    domain::StructureItem item;
    item.kind = entry.kind;
    item.name = entry.path.filename().string();
    item.relativePath = PathUtils::RelativeGeneric(entry.path, root);
    item.depth = entry.depth;
    return item;
}

} // namespace

FileSystemItemInspector::FileSystemItemInspector(fs::path root, const domain::DescriptionEngine& engine)
    : m_root(std::move(root)), m_engine(engine) {}

FileSystemItemInspector::Inspection FileSystemItemInspector::inspect(const domain::WalkEntry& entry) const {
    if (entry.kind == domain::ItemKind::Directory) {
        return inspectDirectory(entry);
    }
    return inspectFile(entry);
}

FileSystemItemInspector::Inspection FileSystemItemInspector::inspectFile(const domain::WalkEntry& entry) const {
    Inspection result;
    result.item = BaseItem(entry, m_root);
    domain::StructureItem& item = result.item;
    item.file.extension = LowerExtension(entry.path);
    item.file.mimeType = MimeTypes::Guess(item.file.extension);

    std::error_code ec;
    fs::file_status st = fs::status(entry.path, ec);
    if (ec) {
        if (IsPermissionError(ec)) {
            item.accessible = false;
            result.permissionDenied = true;
        } else {
            // A dangling symlink still exists as an entry; report it with size 0.
            std::error_code linkEc;
            if (!fs::is_symlink(fs::symlink_status(entry.path, linkEc)) || linkEc) {
                throw domain::ClassificationError("Cannot stat " + item.relativePath + ": " + ec.message());
            }
        }
    } else if (fs::is_regular_file(st)) {
        std::uintmax_t size = fs::file_size(entry.path, ec);
        if (ec) {
            if (!IsPermissionError(ec)) {
                throw domain::ClassificationError("Cannot read size of " + item.relativePath + ": " + ec.message());
            }
            item.accessible = false;
            result.permissionDenied = true;
        } else {
            item.file.sizeBytes = static_cast<std::uint64_t>(size);
        }
    }

    if (item.accessible) {
        struct stat sb;
        if (::stat(entry.path.c_str(), &sb) == 0) {
            item.file.modifiedTime = std::chrono::system_clock::from_time_t(sb.st_mtime);
        }
    }

    domain::FileFacts facts;
    facts.name = item.name;
    facts.extension = item.file.extension;
    facts.sizeBytes = item.file.sizeBytes;
    facts.accessible = item.accessible;
    if (item.accessible && fs::is_regular_file(st) && domain::DescriptionEngine::WantsPreview(facts.extension)) {
        facts.preview = ReadPreview(entry.path);
    }
    item.description = m_engine.describeFile(facts);
    return result;
}

FileSystemItemInspector::Inspection FileSystemItemInspector::inspectDirectory(const domain::WalkEntry& entry) const {
    Inspection result;
    result.item = BaseItem(entry, m_root);
    domain::StructureItem& item = result.item;

    domain::DirectoryFacts facts;
    facts.name = item.name;

    std::error_code ec;
    fs::directory_iterator it(entry.path, ec);
    if (ec) {
        item.accessible = false;
        result.permissionDenied = IsPermissionError(ec);
        std::error_code existsEc;
        if (!result.permissionDenied && !fs::exists(fs::symlink_status(entry.path, existsEc))) {
            throw domain::ClassificationError("Directory vanished: " + item.relativePath);
        }
    } else {
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            ++facts.entryCount;
            std::error_code childEc;
            fs::file_status childStatus = it->status(childEc);
            if (childEc) continue;
            if (fs::is_directory(childStatus)) {
                ++facts.dirCount;
            } else if (fs::is_regular_file(childStatus)) {
                ++facts.fileCount;
                ++facts.extensionCounts[LowerExtension(it->path())];
            }
        }
        if (ec) {
            if (!IsPermissionError(ec)) {
                throw domain::ClassificationError("Listing of " + item.relativePath + " failed: " + ec.message());
            }
            item.accessible = false;
            result.permissionDenied = true;
        }
    }

    facts.accessible = item.accessible;
    if (!item.accessible) {
        facts.entryCount = facts.fileCount = facts.dirCount = 0;
        facts.extensionCounts.clear();
    }
    item.directory.itemCount = facts.entryCount;
    item.directory.isEmpty = item.accessible && facts.entryCount == 0;
    item.description = m_engine.describeDirectory(facts);
    return result;
}

std::optional<std::string> FileSystemItemInspector::ReadPreview(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    std::string buffer(domain::DescriptionEngine::kPreviewBytes, '\0');
    file.read(&buffer[0], static_cast<std::streamsize>(buffer.size()));
    if (file.bad()) return std::nullopt;
    buffer.resize(static_cast<std::size_t>(file.gcount()));
    return buffer;
}

std::string FileSystemItemInspector::LowerExtension(const fs::path& path) {
    return domain::DescriptionEngine::ToLower(path.extension().string());
}

} // namespace foldermapper::infrastructure
