#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace foldermapper::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

std::string PathUtils::RelativeGeneric(const fs::path& path, const fs::path& root) {
    // Lexical: the walker hands out paths built from root, no symlink resolution wanted.
    return path.lexically_relative(root).generic_string();
}

} // namespace foldermapper::infrastructure
