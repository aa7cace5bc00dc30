#include <algorithm>
#include <cassert>
#include <iostream>
#include <random>
#include <string>
#include <vector>
#include "application/JsonExportService.hpp"
#include "application/ReportRenderer.hpp"

using namespace foldermapper;
using application::JsonExportService;
using application::ReportContext;
using application::ReportRenderer;
using domain::ItemKind;
using domain::StructureItem;

namespace {

StructureItem Dir(const std::string& rel, int depth, std::size_t count) {
    StructureItem item;
    item.kind = ItemKind::Directory;
    item.relativePath = rel;
    item.name = rel.substr(rel.rfind('/') == std::string::npos ? 0 : rel.rfind('/') + 1);
    item.depth = depth;
    item.directory.itemCount = count;
    item.directory.isEmpty = count == 0;
    item.description = count == 0 ? "Empty directory" : "Directory containing stuff";
    return item;
}

StructureItem File(const std::string& rel, int depth, std::uint64_t size, const std::string& ext) {
    StructureItem item;
    item.kind = ItemKind::File;
    item.relativePath = rel;
    item.name = rel.substr(rel.rfind('/') == std::string::npos ? 0 : rel.rfind('/') + 1);
    item.depth = depth;
    item.file.sizeBytes = size;
    item.file.extension = ext;
    if (ext == ".md") item.file.mimeType = "text/markdown";
    item.description = "Some file";
    return item;
}

std::vector<StructureItem> Fixture() {
    return {
        File("readme.md", 0, 500, ".md"),
        Dir("src", 0, 3),
        File("src/b.py", 1, 10, ".py"),
        File("src/a.py", 1, 10, ".py"),
        Dir("src/core", 1, 1),
        File("src/core/x.js", 2, 10, ".js"),
        Dir("logs", 0, 0),
        File("Makefile", 0, 42, ""),
        File("notes.md", 0, 7, ".md"),
    };
}

const ReportContext kContext{"fixture.zip", "2026-01-01 12:00:00", "1.25 seconds"};

domain::ProcessingStats Stats() {
    domain::ProcessingStats s;
    s.processedFiles = 6;
    s.processedFolders = 3;
    s.emptyDirectories = 1;
    s.totalSizeBytes = 589;
    return s;
}

void TestDeterminism() {
    std::cout << "[Test] Same input in any order renders identically..." << std::endl;
    auto items = Fixture();
    const std::string first = ReportRenderer::Render(items, Stats(), kContext);
    std::mt19937 rng(42);
    for (int i = 0; i < 5; ++i) {
        std::shuffle(items.begin(), items.end(), rng);
        assert(ReportRenderer::Render(items, Stats(), kContext) == first);
    }
}

void TestSections() {
    std::cout << "[Test] Section order and content..." << std::endl;
    const std::string report = ReportRenderer::Render(Fixture(), Stats(), kContext);

    auto pos = [&report](const std::string& needle) { return report.find(needle); };
    assert(pos("# Comprehensive Folder Mapping Report") == 0);
    assert(pos("**Source:** fixture.zip") != std::string::npos);
    assert(pos("**Processing Time:** 1.25 seconds") != std::string::npos);
    assert(pos("## Summary Statistics") < pos("## Directory Structure Tree"));
    assert(pos("## Directory Structure Tree") < pos("## Detailed File and Folder Listings"));
    assert(pos("## Detailed File and Folder Listings") < pos("## Appendix"));
    assert(pos("- **Total Size:** 589.0 B") != std::string::npos);
    assert(pos("- **Empty Directories:** 1") != std::string::npos);

    // Tree: directories only, sorted by path, indented by depth.
    assert(pos("\xF0\x9F\x93\x81 logs/\n\xF0\x9F\x93\x81 src/\n  \xF0\x9F\x93\x81 core/\n") != std::string::npos);

    // Groups: root first, directories before files inside a group.
    auto root = pos("### Root Directory");
    auto src = pos("### Directory: `src`");
    auto core = pos("### Directory: `src/core`");
    assert(root < src && src < core);
    assert(pos("`logs`") < pos("`src`\n- **Type:** Directory"));
    assert(pos("- **Path:** `src`") < pos("- **Path:** `Makefile`"));
    assert(pos("- **Path:** `src/core`") < pos("- **Path:** `src/a.py`"));
    assert(pos("- **Path:** `src/a.py`") < pos("- **Path:** `src/b.py`"));

    assert(pos("- **MIME Type:** text/markdown") != std::string::npos);
    assert(pos("- **Status:** Accessible") != std::string::npos);
    assert(pos("*Report generated by Comprehensive Folder Mapper*") != std::string::npos);
}

void TestHistogram() {
    std::cout << "[Test] Extension histogram ordering..." << std::endl;
    auto histogram = ReportRenderer::ExtensionHistogram(Fixture());
    // .md and .py tie on 2 and sort alphabetically; files without extension are skipped.
    assert(histogram.size() == 3);
    assert(histogram[0].first == ".md" && histogram[0].second == 2);
    assert(histogram[1].first == ".py" && histogram[1].second == 2);
    assert(histogram[2].first == ".js" && histogram[2].second == 1);

    const std::string report = ReportRenderer::Render(Fixture(), Stats(), kContext);
    assert(report.find("- **.md:** 2 files\n- **.py:** 2 files\n- **.js:** 1 files\n") != std::string::npos);
}

void TestFormatCount() {
    std::cout << "[Test] Thousands separators..." << std::endl;
    assert(ReportRenderer::FormatCount(0) == "0");
    assert(ReportRenderer::FormatCount(999) == "999");
    assert(ReportRenderer::FormatCount(1000) == "1,000");
    assert(ReportRenderer::FormatCount(1234567) == "1,234,567");
}

void TestJsonMirror() {
    std::cout << "[Test] JSON mirror..." << std::endl;
    auto j = JsonExportService::ToJson(Fixture(), Stats(), kContext);
    assert(j["metadata"]["source_file"] == "fixture.zip");
    assert(j["metadata"]["statistics"]["processed_files"] == 6);
    assert(j["metadata"]["statistics"]["total_size_human"] == "589.0 B");
    assert(j["metadata"]["file_statistics"][".md"] == 2);
    assert(j["items"].size() == 9);

    // Same order as the markdown listing: root group, directories first.
    assert(j["items"][0]["path"] == "logs");
    assert(j["items"][0]["type"] == "directory");
    assert(j["items"][0]["is_empty"] == true);
    assert(j["items"][2]["path"] == "Makefile");
    assert(j["items"][2]["mime_type"].is_null());
    assert(j["items"][2]["modified"].is_null());
    assert(j["items"][3]["path"] == "notes.md");
    assert(j["items"][3]["mime_type"] == "text/markdown");

    auto shuffled = Fixture();
    std::reverse(shuffled.begin(), shuffled.end());
    assert(JsonExportService::Render(shuffled, Stats(), kContext) ==
           JsonExportService::Render(Fixture(), Stats(), kContext));
}

} // namespace

int main() {
    TestDeterminism();
    TestSections();
    TestHistogram();
    TestFormatCount();
    TestJsonMirror();
    std::cout << "[PASS] ReportRendererTest" << std::endl;
    return 0;
}
