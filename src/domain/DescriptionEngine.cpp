/**
 * @file DescriptionEngine.cpp
 * @brief Implementation of the DescriptionEngine rule chains.
 */

#include "domain/DescriptionEngine.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <initializer_list>

namespace foldermapper::domain {

namespace {

bool NameContainsAny(const std::string& name, std::initializer_list<const char*> patterns) {
    const std::string lower = DescriptionEngine::ToLower(name);
    for (const char* pattern : patterns) {
        if (lower.find(pattern) != std::string::npos) return true;
    }
    return false;
}

bool IsOneOf(const std::string& value, std::initializer_list<const char*> options) {
    for (const char* option : options) {
        if (value == option) return true;
    }
    return false;
}

std::string Counts(const DirectoryFacts& facts) {
    return std::to_string(facts.fileCount) + " files and " +
           std::to_string(facts.dirCount) + " subdirectories";
}

std::string SizeSuffix(std::uint64_t bytes) {
    return std::string("(") + DescriptionEngine::SizeBucket(bytes) + " size: " +
           DescriptionEngine::FormatSize(bytes) + ")";
}

// "<phrase> [hint] (<bucket> size: <size>)"
std::string FilePhrase(const std::string& phrase, const FileFacts& facts, bool withHint) {
    std::string out = phrase;
    if (withHint) {
        std::string hint = DescriptionEngine::ContentHint(facts);
        if (!hint.empty()) out += " " + hint;
    }
    return out + " " + SizeSuffix(facts.sizeBytes);
}

DescriptionRule<DirectoryFacts> NamePatternRule(const std::string& id,
                                                std::initializer_list<const char*> patterns,
                                                const std::string& phrase) {
    std::vector<std::string> owned(patterns.begin(), patterns.end());
    return {
        id,
        [owned](const DirectoryFacts& f) {
            const std::string lower = DescriptionEngine::ToLower(f.name);
            return std::any_of(owned.begin(), owned.end(), [&lower](const std::string& p) {
                return lower.find(p) != std::string::npos;
            });
        },
        [phrase](const DirectoryFacts& f) { return phrase + " " + Counts(f); }
    };
}

DescriptionRule<DirectoryFacts> DominantExtensionRule(const std::string& id,
                                                      std::initializer_list<const char*> extensions,
                                                      const std::string& phrase) {
    std::vector<std::string> owned(extensions.begin(), extensions.end());
    return {
        id,
        [owned](const DirectoryFacts& f) {
            if (f.extensionCounts.empty()) return false;
            const std::string dominant = DescriptionEngine::DominantExtension(f.extensionCounts);
            return std::find(owned.begin(), owned.end(), dominant) != owned.end();
        },
        [phrase](const DirectoryFacts& f) { return phrase + " " + Counts(f); }
    };
}

DescriptionRule<FileFacts> ExtensionRule(const std::string& id,
                                         std::initializer_list<const char*> extensions,
                                         const std::string& phrase) {
    std::vector<std::string> owned(extensions.begin(), extensions.end());
    return {
        id,
        [owned](const FileFacts& f) {
            return std::find(owned.begin(), owned.end(), f.extension) != owned.end();
        },
        [phrase](const FileFacts& f) { return FilePhrase(phrase, f, true); }
    };
}

DescriptionRule<FileFacts> KeywordRule(const std::string& id, const std::string& keyword,
                                       const std::string& phrase) {
    return {
        id,
        [keyword](const FileFacts& f) { return NameContainsAny(f.name, {keyword.c_str()}); },
        [phrase](const FileFacts& f) { return FilePhrase(phrase, f, false); }
    };
}

} // namespace

DescriptionEngine::DescriptionEngine() {
    buildDirectoryRules();
    buildFileRules();
}

void DescriptionEngine::buildDirectoryRules() {
    m_directoryRules.push_back({
        "inaccessible",
        [](const DirectoryFacts& f) { return !f.accessible; },
        [](const DirectoryFacts&) { return std::string("Directory with restricted access permissions"); }
    });
    m_directoryRules.push_back({
        "empty",
        [](const DirectoryFacts& f) { return f.accessible && f.entryCount == 0; },
        [](const DirectoryFacts&) { return std::string("Empty directory"); }
    });

    m_directoryRules.push_back(NamePatternRule("name:test", {"test"}, "Testing directory containing"));
    m_directoryRules.push_back(NamePatternRule("name:docs", {"doc", "readme"}, "Documentation directory with"));
    m_directoryRules.push_back(NamePatternRule("name:source", {"src", "source"}, "Source code directory containing"));
    m_directoryRules.push_back(NamePatternRule("name:library", {"lib", "vendor"}, "Library directory with"));
    m_directoryRules.push_back(NamePatternRule("name:config", {"config", "conf"}, "Configuration directory containing"));
    m_directoryRules.push_back(NamePatternRule("name:assets", {"asset", "static"}, "Assets directory with"));
    m_directoryRules.push_back(NamePatternRule("name:build", {"build", "dist"}, "Build/distribution directory containing"));

    m_directoryRules.push_back(DominantExtensionRule("ext:python", {".py"}, "Python module directory with"));
    m_directoryRules.push_back(DominantExtensionRule("ext:javascript", {".js", ".ts"}, "JavaScript/TypeScript directory with"));
    m_directoryRules.push_back(DominantExtensionRule("ext:web", {".html", ".css"}, "Web assets directory with"));
    m_directoryRules.push_back(DominantExtensionRule("ext:images", {".jpg", ".png", ".gif", ".svg"}, "Image assets directory with"));

    m_directoryRules.push_back({
        "fallback",
        [](const DirectoryFacts&) { return true; },
        [](const DirectoryFacts& f) { return "Directory containing " + Counts(f); }
    });
}

void DescriptionEngine::buildFileRules() {
    m_fileRules.push_back({
        "inaccessible",
        [](const FileFacts& f) { return !f.accessible; },
        [](const FileFacts&) { return std::string("File with restricted access permissions"); }
    });

    m_fileRules.push_back(ExtensionRule("ext:python", {".py"}, "Python script file"));
    m_fileRules.push_back(ExtensionRule("ext:javascript", {".js", ".ts"}, "JavaScript/TypeScript file"));
    m_fileRules.push_back(ExtensionRule("ext:html", {".html", ".htm"}, "HTML document file"));
    m_fileRules.push_back(ExtensionRule("ext:css", {".css"}, "CSS stylesheet file"));
    m_fileRules.push_back(ExtensionRule("ext:data", {".json", ".yaml", ".yml"}, "Configuration/data file"));
    m_fileRules.push_back(ExtensionRule("ext:text", {".md", ".txt"}, "Text/documentation file"));
    m_fileRules.push_back(ExtensionRule("ext:image", {".jpg", ".jpeg", ".png", ".gif", ".svg"}, "Image file"));
    m_fileRules.push_back(ExtensionRule("ext:document", {".pdf", ".doc", ".docx"}, "Document file"));
    m_fileRules.push_back(ExtensionRule("ext:archive", {".zip", ".tar", ".gz", ".rar"}, "Archive file"));
    m_fileRules.push_back(ExtensionRule("ext:executable", {".exe", ".dll", ".so"}, "Executable/library file"));
    m_fileRules.push_back(ExtensionRule("ext:log", {".log", ".out"}, "Log/output file"));

    m_fileRules.push_back(KeywordRule("name:readme", "readme", "README documentation file"));
    m_fileRules.push_back(KeywordRule("name:license", "license", "License file"));
    m_fileRules.push_back(KeywordRule("name:changelog", "changelog", "Changelog file"));
    m_fileRules.push_back(KeywordRule("name:config", "config", "Configuration file"));
    m_fileRules.push_back(KeywordRule("name:test", "test", "Test file"));

    m_fileRules.push_back({
        "fallback",
        [](const FileFacts&) { return true; },
        [](const FileFacts& f) { return "File " + SizeSuffix(f.sizeBytes); }
    });
}

std::string DescriptionEngine::describeDirectory(const DirectoryFacts& facts) const {
    for (const auto& rule : m_directoryRules) {
        if (rule.matches(facts)) return rule.build(facts);
    }
    return "Directory containing " + Counts(facts);
}

std::string DescriptionEngine::describeFile(const FileFacts& facts) const {
    for (const auto& rule : m_fileRules) {
        if (rule.matches(facts)) return rule.build(facts);
    }
    return "File " + SizeSuffix(facts.sizeBytes);
}

std::string DescriptionEngine::matchingDirectoryRule(const DirectoryFacts& facts) const {
    for (const auto& rule : m_directoryRules) {
        if (rule.matches(facts)) return rule.id;
    }
    return {};
}

std::string DescriptionEngine::matchingFileRule(const FileFacts& facts) const {
    for (const auto& rule : m_fileRules) {
        if (rule.matches(facts)) return rule.id;
    }
    return {};
}

bool DescriptionEngine::WantsPreview(const std::string& extension) {
    return IsOneOf(extension, {".py", ".js", ".html", ".css", ".md", ".txt", ".json", ".yml", ".yaml"});
}

std::string DescriptionEngine::FormatSize(std::uint64_t bytes) {
    static const char* const kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    char buf[64];
    for (const char* unit : kUnits) {
        if (size < 1024.0) {
            std::snprintf(buf, sizeof(buf), "%.1f %s", size, unit);
            return buf;
        }
        size /= 1024.0;
    }
    std::snprintf(buf, sizeof(buf), "%.1f PB", size);
    return buf;
}

const char* DescriptionEngine::SizeBucket(std::uint64_t bytes) {
    if (bytes < 1024) return "small";
    if (bytes < 1024 * 1024) return "medium";
    return "large";
}

std::string DescriptionEngine::DominantExtension(const std::map<std::string, std::size_t>& counts) {
    // std::map iterates alphabetically, so strict '>' keeps the smallest key on ties.
    std::string best;
    std::size_t bestCount = 0;
    for (const auto& [ext, count] : counts) {
        if (count > bestCount) {
            best = ext;
            bestCount = count;
        }
    }
    return best;
}

std::string DescriptionEngine::ContentHint(const FileFacts& facts) {
    if (!facts.preview) return {};
    const std::string& text = *facts.preview;
    auto has = [&text](const char* needle) { return text.find(needle) != std::string::npos; };

    if (facts.extension == ".py") {
        if (has("class ")) return "containing class definitions";
        if (has("def ")) return "containing function definitions";
        if (has("import ")) return "with import statements";
        if (has("#!/usr/bin/env python")) return "executable Python script";
    } else if (facts.extension == ".js") {
        if (has("function")) return "with function definitions";
        if (has("const") || has("let")) return "with variable declarations";
        if (has("import")) return "with ES6 imports";
    } else if (facts.extension == ".json") {
        if (has("package") && has("version")) return "package.json configuration";
        if (has("dependencies")) return "dependency configuration";
        if (has("config")) return "configuration data";
    } else if (facts.extension == ".md") {
        if (has("# ")) return "with headers and documentation";
        std::string upper = facts.name;
        std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c){ return std::toupper(c); });
        if (upper.find("README") != std::string::npos) return "project documentation";
    }
    return {};
}

std::string DescriptionEngine::ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c){ return std::tolower(c); });
    return value;
}

} // namespace foldermapper::domain
