// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace foldermapper::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();

    /** @brief '/'-separated path of @p path relative to @p root. */
    static std::string RelativeGeneric(const std::filesystem::path& path, const std::filesystem::path& root);
};

} // namespace foldermapper::infrastructure
