#include "ConsoleCollaborators.h"
#include "ChunkCipher.h"

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sys/stat.h>

namespace PeerDrop {

std::optional<PeerRecord> ConsolePeerSelector::selectPeer(const std::vector<PeerRecord>& peers) {
    if (peers.empty()) {
        return std::nullopt;
    }

    out_ << "\nAvailable devices:" << std::endl;
    for (size_t i = 0; i < peers.size(); ++i) {
        out_ << "  " << (i + 1) << ". " << peers[i].displayName << " (" << peers[i].address
             << ":" << peers[i].servicePort << ")" << std::endl;
    }
    out_ << "Select device (0 to cancel): " << std::flush;

    std::string line;
    if (!std::getline(in_, line)) {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        int choice = std::stoi(line, &consumed);
        if (choice >= 1 && static_cast<size_t>(choice) <= peers.size()) {
            return peers[static_cast<size_t>(choice - 1)];
        }
    } catch (const std::exception&) {
        // fall through: not a number
    }
    return std::nullopt;
}

Result<std::optional<std::vector<uint8_t>>> loadKeyMaterial(const std::optional<std::string>& keyHex,
                                                            const std::filesystem::path& keyFile) {
    using KeyResult = std::optional<std::vector<uint8_t>>;

    if (keyHex) {
        auto key = ChunkCipher::fromHex(*keyHex);
        if (!key) {
            return Err<KeyResult>(ErrorCode::ConfigurationError, "Invalid --key: " + key.error().message);
        }
        if (key->size() != ChunkCipher::KEY_SIZE) {
            return Err<KeyResult>(ErrorCode::ConfigurationError, "--key must be 64 hex digits");
        }
        return Ok(KeyResult(std::move(*key)));
    }

    std::error_code ec;
    if (keyFile.empty() || !std::filesystem::exists(keyFile, ec)) {
        return Ok(KeyResult());
    }

    std::ifstream file(keyFile, std::ios::binary);
    if (!file) {
        return Err<KeyResult>(ErrorCode::FileError, "Cannot read key file " + keyFile.string());
    }
    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    if (contents.size() == ChunkCipher::KEY_SIZE) {
        return Ok(KeyResult(std::vector<uint8_t>(contents.begin(), contents.end())));
    }

    // Hex text, tolerate a trailing newline
    while (!contents.empty() && (contents.back() == '\n' || contents.back() == '\r' || contents.back() == ' ')) {
        contents.pop_back();
    }
    auto key = ChunkCipher::fromHex(contents);
    if (!key) {
        return Err<KeyResult>(ErrorCode::ConfigurationError,
                              "Key file " + keyFile.string() + " is neither raw nor hex: " + key.error().message);
    }
    if (key->size() != ChunkCipher::KEY_SIZE) {
        return Err<KeyResult>(ErrorCode::ConfigurationError,
                              "Key file " + keyFile.string() + " does not hold a 256-bit key");
    }
    return Ok(KeyResult(std::move(*key)));
}

Result<void> saveKeyFile(const std::filesystem::path& keyFile, const std::vector<uint8_t>& key) {
    namespace fs = std::filesystem;
    const auto ownerOnly = fs::perms::owner_read | fs::perms::owner_write;

    // Tighten an existing file before new key bytes go into it
    std::error_code ec;
    if (fs::exists(keyFile, ec)) {
        fs::permissions(keyFile, ownerOnly, fs::perm_options::replace, ec);
        if (ec) {
            return Err(ErrorCode::FileError, "Cannot restrict permissions on " + keyFile.string() + ": " + ec.message());
        }
    }

    // A new file is created 0600 straight away
    mode_t oldMask = umask(0077);
    std::ofstream out(keyFile, std::ios::trunc);
    umask(oldMask);
    if (!out) {
        return Err(ErrorCode::FileError, "Cannot write " + keyFile.string());
    }

    out << ChunkCipher::toHex(key) << "\n";
    out.close();
    if (!out) {
        return Err(ErrorCode::FileError, "Failed to write " + keyFile.string());
    }
    return Ok();
}

ProgressCallback makeProgressBar(std::ostream& out, const std::string& label) {
    constexpr int width = 30;
    auto last = std::make_shared<int>(-1);

    return [&out, label, last](int percent) {
        if (percent == *last) return;
        *last = percent;

        int filled = percent * width / 100;
        out << "\r" << label << " [" << std::string(filled, '#') << std::string(width - filled, '-') << "] "
            << percent << "%" << std::flush;
        if (percent >= 100) {
            out << std::endl;
        }
    };
}

} // namespace PeerDrop
