#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include "application/ParallelClassifier.hpp"
#include "application/ReportRenderer.hpp"
#include "domain/DescriptionEngine.hpp"
#include "domain/MappingErrors.hpp"
#include "infrastructure/Logger.hpp"

namespace fs = std::filesystem;
using namespace foldermapper;
using application::ParallelClassifier;
using application::StatsAggregator;

namespace {

fs::path MakeTree() {
    fs::path root = fs::temp_directory_path() / "fm_classifier_test";
    fs::remove_all(root);
    fs::create_directories(root / "src" / "core");
    fs::create_directories(root / "logs");
    std::ofstream(root / "readme.md") << std::string(500, 'r');
    std::ofstream(root / "src" / "main.py") << "def main():\n    pass\n";
    std::ofstream(root / "src" / "util.py") << "import os\n";
    std::ofstream(root / "src" / "core" / "engine.js") << "function run() {}\n";
    std::ofstream(root / "big.bin") << std::string(3000, 'b');
    return root;
}

struct RunOutput {
    std::vector<domain::StructureItem> items;
    domain::ProcessingStats stats;
};

RunOutput Classify(const fs::path& root, std::size_t workers, std::size_t chunk) {
    domain::DescriptionEngine engine;
    infrastructure::FileSystemItemInspector inspector(root, engine);
    infrastructure::DirectoryWalker walker(root, 100, chunk);
    StatsAggregator stats;
    ParallelClassifier classifier(inspector, stats, workers);
    RunOutput out;
    out.items = classifier.classifyAll(walker);
    out.stats = stats.snapshot();
    assert(classifier.maxWorkers() == workers);
    return out;
}

void TestFullRun(const fs::path& root) {
    std::cout << "[Test] Every entry classified exactly once..." << std::endl;
    RunOutput out = Classify(root, 4, 3);
    std::set<std::string> paths;
    for (const auto& item : out.items) {
        assert(paths.insert(item.relativePath).second);
    }
    assert(paths.size() == 8);
    assert(out.stats.processedFiles == 5);
    assert(out.stats.processedFolders == 3);
    assert(out.stats.emptyDirectories == 1);
    assert(out.stats.errorsEncountered == 0);

    std::uint64_t sum = 0;
    for (const auto& item : out.items) {
        if (item.isFile()) sum += item.file.sizeBytes;
        if (item.relativePath == "logs") {
            assert(item.directory.isEmpty);
            assert(item.description == "Empty directory");
        }
        if (item.relativePath == "src/main.py") {
            assert(item.depth == 1);
            assert(item.description == "Python script file containing function definitions (small size: 21.0 B)");
        }
    }
    assert(sum == out.stats.totalSizeBytes);
}

void TestWorkerCountDoesNotChangeResult(const fs::path& root) {
    std::cout << "[Test] maxWorkers=1 and maxWorkers=8 agree..." << std::endl;
    RunOutput one = Classify(root, 1, 2);
    RunOutput eight = Classify(root, 8, 2);
    assert(one.stats == eight.stats);

    application::ReportContext ctx{"fixture.zip", "2026-01-01 00:00:00", "0.00 seconds"};
    assert(application::ReportRenderer::Render(one.items, one.stats, ctx) ==
           application::ReportRenderer::Render(eight.items, eight.stats, ctx));
}

void TestFailuresAreDropped() {
    std::cout << "[Test] Failing inspections drop the item and count an error..." << std::endl;
    StatsAggregator stats;
    std::atomic<int> calls{0};
    ParallelClassifier classifier(
        [&calls](const domain::WalkEntry& entry) {
            ++calls;
            if (entry.path.filename() == "bad") {
                throw domain::ClassificationError("cannot inspect");
            }
            ParallelClassifier::Inspection inspection;
            inspection.item.kind = entry.kind;
            inspection.item.name = entry.path.filename().string();
            inspection.item.relativePath = inspection.item.name;
            inspection.item.file.sizeBytes = 10;
            return inspection;
        },
        stats, 3);

    domain::Batch batch;
    for (const char* name : {"a", "bad", "b", "bad", "c"}) {
        batch.push_back({fs::path("/virtual") / name, domain::ItemKind::File, 0});
    }
    classifier.classifyBatch(batch);

    auto items = classifier.takeResults();
    assert(calls.load() == 5);
    assert(items.size() == 3);
    assert(classifier.summary().itemsDropped == 2);
    auto s = stats.snapshot();
    assert(s.errorsEncountered == 2);
    assert(s.processedFiles == 3);
    assert(s.totalSizeBytes == 30);
}

void TestBatchWhereEverythingFails() {
    std::cout << "[Test] A batch where every item fails completes empty..." << std::endl;
    StatsAggregator stats;
    ParallelClassifier classifier(
        [](const domain::WalkEntry&) -> ParallelClassifier::Inspection {
            throw std::runtime_error("disk gone");
        },
        stats, 2);

    domain::Batch batch;
    for (int i = 0; i < 7; ++i) {
        batch.push_back({fs::path("/virtual") / std::to_string(i), domain::ItemKind::Directory, 0});
    }
    classifier.classifyBatch(batch);
    assert(classifier.takeResults().empty());
    assert(stats.snapshot().errorsEncountered == 7);
    assert(stats.snapshot().processedFolders == 0);
    assert(classifier.summary().batches == 1);
    assert(classifier.summary().entriesSubmitted == 7);
}

void TestPermissionDeniedIsKept() {
    std::cout << "[Test] Permission denials keep the item..." << std::endl;
    StatsAggregator stats;
    ParallelClassifier classifier(
        [](const domain::WalkEntry& entry) {
            ParallelClassifier::Inspection inspection;
            inspection.item.kind = entry.kind;
            inspection.item.relativePath = entry.path.filename().string();
            inspection.item.accessible = false;
            inspection.item.file.sizeBytes = 999;
            inspection.permissionDenied = true;
            return inspection;
        },
        stats, 2);
    classifier.classifyBatch({{fs::path("/virtual/locked"), domain::ItemKind::File, 0}});
    auto items = classifier.takeResults();
    assert(items.size() == 1);
    assert(!items[0].accessible);
    auto s = stats.snapshot();
    assert(s.permissionDenials == 1);
    assert(s.errorsEncountered == 0);
    assert(s.totalSizeBytes == 0);
}

} // namespace

int main() {
    infrastructure::Logger::Instance().setConsoleEnabled(false);
    fs::path root = MakeTree();
    TestFullRun(root);
    TestWorkerCountDoesNotChangeResult(root);
    TestFailuresAreDropped();
    TestBatchWhereEverythingFails();
    TestPermissionDeniedIsKept();
    fs::remove_all(root);
    std::cout << "[PASS] ParallelClassifierTest" << std::endl;
    return 0;
}
