#pragma once

#include "ChunkCipher.h"

#include <memory>
#include <variant>

namespace PeerDrop {

/// Chunks go on the wire as raw bytes
struct PlainTransfer {};

/// Every chunk is sealed with AES-256-GCM and framed
struct EncryptedTransfer {
    std::shared_ptr<const ChunkCipher> cipher;
};

using TransferMode = std::variant<PlainTransfer, EncryptedTransfer>;

inline bool isEncrypted(const TransferMode& mode) {
    return std::holds_alternative<EncryptedTransfer>(mode);
}

} // namespace PeerDrop
