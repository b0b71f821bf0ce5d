#pragma once

#include <filesystem>
#include <string>

namespace PeerDrop {

class PathUtils {
public:
    static std::filesystem::path getHome();
    static std::filesystem::path getConfigDir();
    static std::filesystem::path getConfigFilePath();
    static void ensureDirectory(const std::filesystem::path& dir);
};

} // namespace PeerDrop
