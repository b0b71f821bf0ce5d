#pragma once

#include "Result.h"
#include "TransferInterfaces.h"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace PeerDrop {

/**
 * @brief Numbered console menu; 0, EOF or a bad number means "none"
 */
class ConsolePeerSelector : public IPeerSelector {
public:
    ConsolePeerSelector(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    std::optional<PeerRecord> selectPeer(const std::vector<PeerRecord>& peers) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

/// Hands out a key that was loaded up front
class StaticKeyProvider : public IKeyProvider {
public:
    explicit StaticKeyProvider(std::optional<std::vector<uint8_t>> key) : key_(std::move(key)) {}

    std::optional<std::vector<uint8_t>> key() override { return key_; }

private:
    std::optional<std::vector<uint8_t>> key_;
};

/**
 * @brief Resolve the shared key from --key or the key file
 *
 * A hex key on the command line wins. A missing key file is not an error
 * (the result is empty); a present but malformed one is. Key files hold
 * either 32 raw bytes or 64 hex digits.
 */
Result<std::optional<std::vector<uint8_t>>> loadKeyMaterial(const std::optional<std::string>& keyHex,
                                                            const std::filesystem::path& keyFile);

/**
 * @brief Write the key as hex to keyFile, readable by the owner only
 *
 * The file is never visible with wider permissions, including when an
 * existing key file is overwritten.
 */
Result<void> saveKeyFile(const std::filesystem::path& keyFile, const std::vector<uint8_t>& key);

/// "[#####-----]  50%" redrawn in place; newline once 100 is reached
ProgressCallback makeProgressBar(std::ostream& out, const std::string& label);

} // namespace PeerDrop
