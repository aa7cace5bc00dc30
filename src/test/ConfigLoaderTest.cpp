#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include "app/FolderMapperApp.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

namespace fs = std::filesystem;
using foldermapper::app::CommandLine;
using foldermapper::app::FolderMapperApp;
using foldermapper::domain::MappingOptions;
using foldermapper::infrastructure::ConfigLoader;
using foldermapper::infrastructure::PathUtils;

namespace {

fs::path Dir() {
    static fs::path dir = fs::temp_directory_path() / "fm_config_test";
    return dir;
}

void Write(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream(p) << content;
}

CommandLine Parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    argv.push_back(nullptr);
    return FolderMapperApp::ParseCommandLine(static_cast<int>(args.size()), argv.data());
}

void TestMissingFileKeepsDefaults() {
    std::cout << "[Test] Missing settings file..." << std::endl;
    MappingOptions options;
    assert(!ConfigLoader::ApplySettings(Dir() / "nope.json", options));
    assert(options.maxDepth == 100);
    assert(options.maxWorkers == 8);
    assert(options.chunkSize == 5000);
    assert(options.outputPath == "folder_mapping.md");
}

void TestSettingsApplied() {
    std::cout << "[Test] Settings overlay..." << std::endl;
    const fs::path file = Dir() / "settings.json";
    Write(file, R"({"max_depth": 3, "max_workers": 2, "json_output": true, "json_path": "out.json", "unknown": 1})");
    MappingOptions options;
    assert(!ConfigLoader::ApplySettings(file, options));
    assert(options.maxDepth == 3);
    assert(options.maxWorkers == 2);
    assert(options.chunkSize == 5000);
    assert(options.jsonOutput);
    assert(options.jsonPath == "out.json");
}

void TestBadValuesReported() {
    std::cout << "[Test] Invalid settings fall back..." << std::endl;
    const fs::path file = Dir() / "bad.json";
    Write(file, R"({"max_depth": "deep", "chunk_size": 0, "verbose": true})");
    MappingOptions options;
    auto problems = ConfigLoader::ApplySettings(file, options);
    assert(problems);
    assert(problems->find("max_depth") != std::string::npos);
    assert(problems->find("chunk_size") != std::string::npos);
    assert(options.maxDepth == 100);
    assert(options.chunkSize == 5000);
    assert(options.verbose);

    const fs::path broken = Dir() / "broken.json";
    Write(broken, "{ not json");
    MappingOptions untouched;
    assert(ConfigLoader::ApplySettings(broken, untouched));
    assert(untouched.maxWorkers == 8);
}

void TestNumericRanges() {
    std::cout << "[Test] Out-of-range numbers are reported, not wrapped..." << std::endl;
    const fs::path file = Dir() / "ranges.json";
    Write(file, R"({"max_workers": -1, "chunk_size": -5, "max_depth": 4294967296})");
    MappingOptions options;
    auto problems = ConfigLoader::ApplySettings(file, options);
    assert(problems);
    assert(problems->find("max_workers") != std::string::npos);
    assert(problems->find("chunk_size") != std::string::npos);
    assert(problems->find("max_depth") != std::string::npos);
    assert(options.maxWorkers == 8);
    assert(options.chunkSize == 5000);
    assert(options.maxDepth == 100);

    Write(file, R"({"max_workers": 18446744073709551615, "chunk_size": 2.5, "max_depth": -1})");
    MappingOptions huge;
    problems = ConfigLoader::ApplySettings(file, huge);
    assert(problems);
    assert(huge.maxWorkers == 8);
    assert(huge.chunkSize == 5000);
    assert(huge.maxDepth == 100);

    Write(file, R"({"max_workers": 1024, "chunk_size": 1, "max_depth": 0})");
    MappingOptions edges;
    assert(!ConfigLoader::ApplySettings(file, edges));
    assert(edges.maxWorkers == foldermapper::domain::kMaxWorkerLimit);
    assert(edges.chunkSize == 1);
    assert(edges.maxDepth == 0);

    Write(file, R"({"max_workers": 1025})");
    MappingOptions tooMany;
    assert(ConfigLoader::ApplySettings(file, tooMany));
    assert(tooMany.maxWorkers == 8);
}

void TestConfigHome() {
    std::cout << "[Test] XDG config home..." << std::endl;
    setenv("XDG_CONFIG_HOME", "/tmp/fm_xdg", 1);
    assert(PathUtils::GetConfigHome() == fs::path("/tmp/fm_xdg"));
    assert(ConfigLoader::DefaultSettingsPath() == fs::path("/tmp/fm_xdg/FolderMapper/settings.json"));
    assert(PathUtils::RelativeGeneric("/a/b/c/d.txt", "/a/b") == "c/d.txt");
}

void TestCommandLine() {
    std::cout << "[Test] Command line parsing and precedence..." << std::endl;
    CommandLine cli = Parse({"folder_mapper", "-o", "map.md", "--max-depth", "4", "--max-workers=3",
                             "-j", "--chunk-size", "10", "input.zip"});
    assert(cli.error.empty());
    assert(!cli.showHelp);
    assert(cli.archivePath && *cli.archivePath == "input.zip");
    assert(cli.outputPath && *cli.outputPath == "map.md");
    assert(cli.maxDepth && *cli.maxDepth == 4);
    assert(cli.maxWorkers && *cli.maxWorkers == 3);
    assert(cli.chunkSize && *cli.chunkSize == 10);
    assert(cli.jsonOutput && *cli.jsonOutput);
    assert(!cli.verbose);

    assert(Parse({"folder_mapper", "--help"}).showHelp);
    assert(!Parse({"folder_mapper", "--max-workers", "0", "x.zip"}).error.empty());
    assert(!Parse({"folder_mapper", "--max-depth", "-1", "x.zip"}).error.empty());
    assert(!Parse({"folder_mapper", "--max-depth", "4294967296", "x.zip"}).error.empty());
    assert(!Parse({"folder_mapper", "--max-depth", "4294967295", "x.zip"}).error.empty());
    assert(!Parse({"folder_mapper", "--max-workers", "1025", "x.zip"}).error.empty());
    assert(!Parse({"folder_mapper", "--chunk-size", "99999999999", "x.zip"}).error.empty());
    CommandLine deepest = Parse({"folder_mapper", "--max-depth", "2147483647", "x.zip"});
    assert(deepest.error.empty() && deepest.maxDepth && *deepest.maxDepth == 2147483647);
    assert(!Parse({"folder_mapper", "--bogus", "x.zip"}).error.empty());
    assert(!Parse({"folder_mapper", "a.zip", "b.zip"}).error.empty());

    // settings file < explicit flags
    const fs::path file = Dir() / "precedence.json";
    Write(file, R"({"max_depth": 9, "max_workers": 5, "output": "from_settings.md"})");
    CommandLine withConfig = Parse({"folder_mapper", "-c", file.string(), "--max-workers", "2", "in.zip"});
    std::optional<std::string> problems;
    MappingOptions resolved = FolderMapperApp::ResolveOptions(withConfig, problems);
    assert(!problems);
    assert(resolved.archivePath == "in.zip");
    assert(resolved.maxDepth == 9);
    assert(resolved.maxWorkers == 2);
    assert(resolved.outputPath == "from_settings.md");
    assert(resolved.chunkSize == 5000);
}

} // namespace

int main() {
    fs::remove_all(Dir());
    TestMissingFileKeepsDefaults();
    TestSettingsApplied();
    TestBadValuesReported();
    TestNumericRanges();
    TestConfigHome();
    TestCommandLine();
    fs::remove_all(Dir());
    std::cout << "[PASS] ConfigLoaderTest" << std::endl;
    return 0;
}
