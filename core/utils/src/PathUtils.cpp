#include "PathUtils.h"
#include <cstdlib>
#include <stdexcept>

namespace PeerDrop {

std::filesystem::path PathUtils::getHome() {
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home);
    }
    throw std::runtime_error("HOME environment variable is not set");
}

std::filesystem::path PathUtils::getConfigDir() {
    if (const char* config = std::getenv("XDG_CONFIG_HOME")) {
        return std::filesystem::path(config) / "peerdrop";
    }
    return getHome() / ".config" / "peerdrop";
}

std::filesystem::path PathUtils::getConfigFilePath() {
    return getConfigDir() / "peerdrop.conf";
}

void PathUtils::ensureDirectory(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::exists(dir)) {
        std::filesystem::create_directories(dir, ec);
    }
    if (ec) {
        throw std::runtime_error("Failed to create directory: " + dir.string() + " (" + ec.message() + ")");
    }
}

} // namespace PeerDrop
