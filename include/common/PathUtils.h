#pragma once

#include <string>
#include <filesystem>

namespace rebalsim {
namespace utils {

class PathUtils {
public:
    // Directory holding the running executable (falls back to the working directory)
    static std::filesystem::path getExecutableDir();

    // Absolute paths pass through; relative ones resolve against the executable dir
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace rebalsim
