#pragma once

#include <string>
#include <filesystem>

namespace orderguard {
namespace utils {

class PathUtils {
public:
    // Directory holding the running executable; falls back to the cwd.
    static std::filesystem::path getExecutableDir();

    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    static std::filesystem::path getConfigDir();
};

} // namespace utils
} // namespace orderguard
