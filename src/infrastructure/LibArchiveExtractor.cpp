/**
 * @file LibArchiveExtractor.cpp
 * @brief Implementation of LibArchiveExtractor.
 */

#include "infrastructure/LibArchiveExtractor.hpp"
#include "domain/MappingErrors.hpp"
#include "infrastructure/Logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

namespace foldermapper::infrastructure {

namespace fs = std::filesystem;

namespace {

const char* kComponent = "Extractor";

struct ReadArchiveDeleter {
    void operator()(struct archive* a) const { if (a) archive_read_free(a); }
};
struct WriteArchiveDeleter {
    void operator()(struct archive* a) const { if (a) archive_write_free(a); }
};
using ReadArchivePtr = std::unique_ptr<struct archive, ReadArchiveDeleter>;
using WriteArchivePtr = std::unique_ptr<struct archive, WriteArchiveDeleter>;

std::string ArchiveError(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

// Entry names are joined onto the destination, so they must stay inside it.
bool IsSafeEntryPath(const fs::path& entryPath) {
    if (entryPath.empty() || entryPath.is_absolute() || entryPath.has_root_name()) return false;
    for (const auto& part : entryPath) {
        if (part == "..") return false;
    }
    return true;
}

void CopyData(struct archive* reader, struct archive* writer, const std::string& entryName) {
    const void* buff = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;
    for (;;) {
        int r = archive_read_data_block(reader, &buff, &size, &offset);
        if (r == ARCHIVE_EOF) return;
        if (r < ARCHIVE_WARN) {
            throw domain::ExtractionError("Failed reading '" + entryName + "': " + ArchiveError(reader));
        }
        if (archive_write_data_block(writer, buff, size, offset) < ARCHIVE_WARN) {
            throw domain::ExtractionError("Failed writing '" + entryName + "': " + ArchiveError(writer));
        }
    }
}

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() > suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

LibArchiveExtractor::LibArchiveExtractor(fs::path tempBase)
    : m_tempBase(std::move(tempBase)) {}

fs::path LibArchiveExtractor::extract(const fs::path& archivePath,
                                      std::unique_ptr<domain::TemporaryDirectory>& workspace) {
    m_nestedExtracted = 0;
    m_nestedFailed = 0;

    std::error_code ec;
    if (!fs::exists(archivePath, ec)) {
        throw domain::ExtractionError("Archive not found: " + archivePath.string());
    }
    if (!fs::is_regular_file(archivePath, ec)) {
        throw domain::ExtractionError("Archive is not a regular file: " + archivePath.string());
    }

    workspace = std::make_unique<domain::TemporaryDirectory>(createWorkspace());
    const fs::path root = workspace->path();
    FM_LOG(Info, kComponent, "Created temporary directory: " << root.string());

    std::size_t entries = ExtractInto(archivePath, root);
    FM_LOG(Info, kComponent, "Extracted " << entries << " items from " << archivePath.filename().string());

    processNestedArchives(root);

    FM_LOG(Info, kComponent, "Extraction completed: " << root.string());
    return root;
}

std::size_t LibArchiveExtractor::ExtractInto(const fs::path& archivePath, const fs::path& destination) {
    ReadArchivePtr reader(archive_read_new());
    WriteArchivePtr writer(archive_write_disk_new());
    if (!reader || !writer) {
        throw domain::ExtractionError("Out of memory creating libarchive handles");
    }

    archive_read_support_format_zip(reader.get());
    archive_read_support_format_tar(reader.get());
    archive_read_support_format_gnutar(reader.get());
    archive_read_support_format_7zip(reader.get());
    archive_read_support_format_rar(reader.get());
    archive_read_support_format_rar5(reader.get());
    archive_read_support_filter_all(reader.get());

    // Entry names are rewritten to absolute paths under the destination after
    // IsSafeEntryPath, so NOABSOLUTEPATHS must stay off.
    archive_write_disk_set_options(writer.get(),
                                   ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                   ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(writer.get());

    if (archive_read_open_filename(reader.get(), archivePath.c_str(), 10240) != ARCHIVE_OK) {
        throw domain::ExtractionError("Cannot open archive " + archivePath.string() + ": " +
                                      ArchiveError(reader.get()));
    }

    std::size_t written = 0;
    std::size_t writeFailures = 0;
    std::string lastWriteError;
    struct archive_entry* entry = nullptr;
    for (;;) {
        int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            throw domain::ExtractionError("Invalid archive " + archivePath.string() + ": " +
                                          ArchiveError(reader.get()));
        }
        if (r == ARCHIVE_WARN) {
            FM_LOG(Warn, kComponent, archivePath.filename().string() << ": " << ArchiveError(reader.get()));
        }

        const char* rawName = archive_entry_pathname(entry);
        const std::string entryName = rawName ? rawName : "";
        const fs::path entryPath = fs::path(entryName).lexically_normal();
        if (!IsSafeEntryPath(entryPath) || entryPath == ".") {
            FM_LOG(Warn, kComponent, "Skipping unsafe entry '" << entryName << "' in " << archivePath.filename().string());
            continue;
        }

        const std::string target = (destination / entryPath).string();
        archive_entry_set_pathname(entry, target.c_str());
        if (const char* link = archive_entry_hardlink(entry)) {
            const fs::path linkPath = fs::path(link).lexically_normal();
            if (!IsSafeEntryPath(linkPath)) {
                FM_LOG(Warn, kComponent, "Skipping hard link '" << entryName << "' with unsafe target");
                continue;
            }
            const std::string linkTarget = (destination / linkPath).string();
            archive_entry_set_hardlink(entry, linkTarget.c_str());
        }

        r = archive_write_header(writer.get(), entry);
        if (r < ARCHIVE_WARN) {
            if (r == ARCHIVE_FATAL) {
                throw domain::ExtractionError("Cannot write '" + entryName + "': " + ArchiveError(writer.get()));
            }
            lastWriteError = ArchiveError(writer.get());
            ++writeFailures;
            FM_LOG(Warn, kComponent, "Skipping '" << entryName << "': " << lastWriteError);
            continue;
        }
        if (archive_entry_size(entry) > 0) {
            CopyData(reader.get(), writer.get(), entryName);
        }
        if (archive_write_finish_entry(writer.get()) < ARCHIVE_WARN) {
            FM_LOG(Warn, kComponent, "Could not finalize '" << entryName << "': " << ArchiveError(writer.get()));
        }
        ++written;
    }

    archive_read_close(reader.get());
    archive_write_close(writer.get());
    if (written == 0 && writeFailures > 0) {
        throw domain::ExtractionError("No entry of " + archivePath.filename().string() +
                                      " could be written (" + std::to_string(writeFailures) +
                                      " failures, last: " + lastWriteError + ")");
    }
    return written;
}

std::optional<std::string> LibArchiveExtractor::NestedArchiveStem(const std::string& filename) {
    static const char* const kSuffixes[] = {".tar.gz", ".zip", ".rar", ".7z"};
    std::string lower = filename;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return std::tolower(c); });
    for (const char* suffix : kSuffixes) {
        if (EndsWith(lower, suffix)) {
            return filename.substr(0, filename.size() - std::strlen(suffix));
        }
    }
    return std::nullopt;
}

fs::path LibArchiveExtractor::createWorkspace() const {
    std::string pattern = (m_tempBase / "folder_mapper_XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        throw domain::ExtractionError("Cannot create temporary directory under " + m_tempBase.string() +
                                      ": " + std::strerror(errno));
    }
    return fs::path(buffer.data());
}

void LibArchiveExtractor::processNestedArchives(const fs::path& root) {
    std::vector<fs::path> nested;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entryEc;
        if (it->is_symlink(entryEc) || !it->is_regular_file(entryEc)) continue;
        if (NestedArchiveStem(it->path().filename().string())) {
            nested.push_back(it->path());
        }
    }
    if (ec) {
        FM_LOG(Warn, kComponent, "Nested archive scan stopped early: " << ec.message());
    }
    if (nested.empty()) return;

    FM_LOG(Info, kComponent, "Found " << nested.size() << " nested archives");
    for (const auto& archivePath : nested) {
        const std::string stem = *NestedArchiveStem(archivePath.filename().string());
        const fs::path target = archivePath.parent_path() / (stem + "_extracted");
        try {
            fs::create_directories(target);
            ExtractInto(archivePath, target);
            ++m_nestedExtracted;
            FM_LOG(Info, kComponent, "Extracted nested archive: " << archivePath.lexically_relative(root).generic_string());
        } catch (const std::exception& e) {
            ++m_nestedFailed;
            FM_LOG(Warn, kComponent, "Failed to extract nested archive "
                   << archivePath.lexically_relative(root).generic_string() << ": " << e.what());
        }
    }
}

} // namespace foldermapper::infrastructure
