#include "PathValidator.h"
#include "Constants.h"
#include "Logger.h"
#include "WireFormat.h"

namespace PeerDrop {

Result<std::string> PathValidator::sanitizeFileName(const std::string& name) {
    if (name.empty()) {
        return Err<std::string>(ErrorCode::ProtocolError, "Empty file name");
    }
    if (name.size() > config::MAX_FILENAME_LENGTH) {
        return Err<std::string>(ErrorCode::ProtocolError,
                                "File name too long (" + std::to_string(name.size()) + " bytes)");
    }
    if (!WireFormat::isValidUtf8(name)) {
        return Err<std::string>(ErrorCode::ProtocolError, "File name is not valid UTF-8");
    }
    if (name == "." || name == ".." || containsSuspiciousPatterns(name)) {
        Logger::instance().warn("Rejected unsafe file name: " + name, "PathValidator");
        return Err<std::string>(ErrorCode::ProtocolError, "Unsafe file name: " + name);
    }
    return Ok(name);
}

bool PathValidator::isPathWithinDirectory(const std::filesystem::path& basePath, const std::string& relativePath) {
    try {
        if (containsSuspiciousPatterns(relativePath)) {
            return false;
        }

        std::filesystem::path absBase = std::filesystem::absolute(basePath).lexically_normal();
        std::filesystem::path absPath = (absBase / relativePath).lexically_normal();

        auto absBaseStr = absBase.string();
        auto absPathStr = absPath.string();

        // Ensure the base ends with a separator so "/a/bc" is not inside "/a/b"
        if (absBaseStr.back() != '/') {
            absBaseStr += '/';
        }

        return absPathStr.size() > absBaseStr.size() && absPathStr.compare(0, absBaseStr.size(), absBaseStr) == 0;

    } catch (const std::filesystem::filesystem_error& e) {
        Logger::instance().error("Path validation error: " + std::string(e.what()), "PathValidator");
        return false;
    }
}

bool PathValidator::containsSuspiciousPatterns(const std::string& name) {
    // Path separators would let the name escape the save directory
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        return true;
    }

    if (name.find("..") != std::string::npos && name.find_first_not_of('.') == std::string::npos) {
        return true;
    }

    // NUL and other control characters
    for (unsigned char c : name) {
        if (c < 0x20 || c == 0x7f) {
            return true;
        }
    }

    // Windows drive letters
    if (name.length() >= 2 && name[1] == ':') {
        return true;
    }

    return false;
}

} // namespace PeerDrop
