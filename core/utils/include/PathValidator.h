#pragma once

#include "Result.h"

#include <string>
#include <filesystem>

namespace PeerDrop {

/**
 * @brief Validation of file names that arrive from the network
 *
 * The receiver only ever writes into its save directory, so a wire-supplied
 * name must be a single path component. Anything else is rejected rather
 * than rewritten.
 */
class PathValidator {
public:
    /**
     * @brief Checks that a wire name is a usable base name
     * @param name Raw bytes received in the transfer header
     * @return The name unchanged on success, ProtocolError otherwise
     */
    static Result<std::string> sanitizeFileName(const std::string& name);

    /**
     * @brief Validates that a relative path stays within the base directory
     * @param basePath The base directory
     * @param relativePath The relative path from network/external source
     * @return true if the path is safe, false otherwise
     */
    static bool isPathWithinDirectory(const std::filesystem::path& basePath, const std::string& relativePath);

    /**
     * @brief Checks if a name contains separators, traversal or control bytes
     */
    static bool containsSuspiciousPatterns(const std::string& name);
};

} // namespace PeerDrop
