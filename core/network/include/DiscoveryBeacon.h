#pragma once

#include "Result.h"

#include <cstdint>
#include <string>
#include <vector>

namespace PeerDrop {

/**
 * @brief Presence announcement broadcast by every running DiscoverySession
 *
 * Wire layout (big-endian):
 *   [4 bytes "PDRP"][u8 version][u16 servicePort][u16 nameLen][name UTF-8]
 */
struct DiscoveryBeacon {
    static constexpr uint8_t MAGIC[4] = {'P', 'D', 'R', 'P'};
    static constexpr uint8_t VERSION = 1;
    static constexpr size_t HEADER_SIZE = 9;

    std::string displayName;
    uint16_t servicePort = 0;

    /// SerializationError for an oversized or non-UTF-8 name, or port 0
    Result<std::vector<uint8_t>> encode() const;

    /// SerializationError unless the payload is exactly one well-formed beacon
    static Result<DiscoveryBeacon> decode(const uint8_t* data, size_t size);
    static Result<DiscoveryBeacon> decode(const std::vector<uint8_t>& payload);
};

} // namespace PeerDrop
