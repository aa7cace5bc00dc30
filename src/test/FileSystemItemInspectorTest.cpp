#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>
#include "domain/DescriptionEngine.hpp"
#include "domain/MappingErrors.hpp"
#include "infrastructure/FileSystemItemInspector.hpp"

namespace fs = std::filesystem;
using namespace foldermapper;
using infrastructure::FileSystemItemInspector;

namespace {

fs::path Root() {
    static fs::path root = fs::temp_directory_path() / "fm_inspector_test";
    return root;
}

domain::WalkEntry Entry(const std::string& rel, domain::ItemKind kind, int depth = 0) {
    return {Root() / rel, kind, depth};
}

void TestRegularEntries(const FileSystemItemInspector& inspector) {
    std::cout << "[Test] Regular file and directory..." << std::endl;
    fs::create_directories(Root() / "src");
    std::ofstream(Root() / "src" / "README.md") << "# Title\n";
    std::ofstream(Root() / "src" / "a.py") << "x = 1\n";

    auto file = inspector.inspect(Entry("src/README.md", domain::ItemKind::File, 1));
    assert(!file.permissionDenied);
    assert(file.item.accessible);
    assert(file.item.relativePath == "src/README.md");
    assert(file.item.depth == 1);
    assert(file.item.file.extension == ".md");
    assert(file.item.file.sizeBytes == 8);
    assert(file.item.file.mimeType && *file.item.file.mimeType == "text/markdown");
    assert(file.item.file.modifiedTime);
    assert(file.item.description == "Text/documentation file with headers and documentation (small size: 8.0 B)");

    auto dir = inspector.inspect(Entry("src", domain::ItemKind::Directory));
    assert(dir.item.accessible);
    assert(dir.item.directory.itemCount == 2);
    assert(!dir.item.directory.isEmpty);
    assert(dir.item.description == "Source code directory containing 2 files and 0 subdirectories");
}

void TestDanglingSymlinkKept(const FileSystemItemInspector& inspector) {
    std::cout << "[Test] Dangling symlink is kept with size 0..." << std::endl;
    std::error_code ec;
    fs::create_symlink(Root() / "missing_target.txt", Root() / "dangling", ec);
    if (ec) {
        std::cout << "[Test] symlinks unsupported here, skipped" << std::endl;
        return;
    }
    auto result = inspector.inspect(Entry("dangling", domain::ItemKind::File));
    assert(result.item.accessible);
    assert(!result.permissionDenied);
    assert(result.item.file.sizeBytes == 0);
    assert(!result.item.file.modifiedTime);
    assert(result.item.description == "File (small size: 0.0 B)");
}

void TestVanishedPathsRaise(const FileSystemItemInspector& inspector) {
    std::cout << "[Test] Vanished entries raise ClassificationError..." << std::endl;
    bool threw = false;
    try {
        inspector.inspect(Entry("gone.txt", domain::ItemKind::File));
    } catch (const domain::ClassificationError&) {
        threw = true;
    }
    assert(threw);

    fs::create_directories(Root() / "short_lived");
    fs::remove(Root() / "short_lived");
    threw = false;
    try {
        inspector.inspect(Entry("short_lived", domain::ItemKind::Directory));
    } catch (const domain::ClassificationError&) {
        threw = true;
    }
    assert(threw);
}

void TestPermissionDenied(const FileSystemItemInspector& inspector) {
    std::cout << "[Test] Permission errors keep the item as inaccessible..." << std::endl;
    if (geteuid() == 0) {
        std::cout << "[Test] running as root, permission checks do not apply, skipped" << std::endl;
        return;
    }
    const fs::path locked = Root() / "locked";
    fs::create_directories(locked);
    std::ofstream(locked / "inside.txt") << "secret";
    fs::permissions(locked, fs::perms::none);

    auto dir = inspector.inspect(Entry("locked", domain::ItemKind::Directory));
    auto file = inspector.inspect(Entry("locked/inside.txt", domain::ItemKind::File, 1));
    fs::permissions(locked, fs::perms::owner_all);

    assert(dir.permissionDenied);
    assert(!dir.item.accessible);
    assert(!dir.item.directory.isEmpty);
    assert(dir.item.description == "Directory with restricted access permissions");

    assert(file.permissionDenied);
    assert(!file.item.accessible);
    assert(file.item.file.sizeBytes == 0);
    assert(file.item.description == "File with restricted access permissions");
}

} // namespace

int main() {
    fs::remove_all(Root());
    fs::create_directories(Root());
    domain::DescriptionEngine engine;
    FileSystemItemInspector inspector(Root(), engine);
    TestRegularEntries(inspector);
    TestDanglingSymlinkKept(inspector);
    TestVanishedPathsRaise(inspector);
    TestPermissionDenied(inspector);
    fs::remove_all(Root());
    std::cout << "[PASS] FileSystemItemInspectorTest" << std::endl;
    return 0;
}
