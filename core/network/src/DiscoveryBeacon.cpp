#include "DiscoveryBeacon.h"
#include "Constants.h"
#include "WireFormat.h"

#include <cstring>

namespace PeerDrop {

namespace {

Result<void> checkFields(const std::string& name, uint16_t port) {
    if (port == 0) {
        return Err(ErrorCode::SerializationError, "Beacon service port is 0");
    }
    if (name.size() > config::MAX_DISPLAY_NAME_LENGTH) {
        return Err(ErrorCode::SerializationError,
                   "Beacon name too long (" + std::to_string(name.size()) + " bytes)");
    }
    if (!WireFormat::isValidUtf8(name)) {
        return Err(ErrorCode::SerializationError, "Beacon name is not valid UTF-8");
    }
    return Ok();
}

} // namespace

Result<std::vector<uint8_t>> DiscoveryBeacon::encode() const {
    if (auto check = checkFields(displayName, servicePort); !check) {
        return check.error();
    }

    std::vector<uint8_t> out;
    out.reserve(HEADER_SIZE + displayName.size());
    WireFormat::appendBytes(out, MAGIC, sizeof(MAGIC));
    WireFormat::appendU8(out, VERSION);
    WireFormat::appendU16(out, servicePort);
    WireFormat::appendU16(out, static_cast<uint16_t>(displayName.size()));
    WireFormat::appendBytes(out, displayName);
    return Ok(std::move(out));
}

Result<DiscoveryBeacon> DiscoveryBeacon::decode(const uint8_t* data, size_t size) {
    if (size < HEADER_SIZE) {
        return Err<DiscoveryBeacon>(ErrorCode::SerializationError,
                                    "Beacon too short (" + std::to_string(size) + " bytes)");
    }
    if (std::memcmp(data, MAGIC, sizeof(MAGIC)) != 0) {
        return Err<DiscoveryBeacon>(ErrorCode::SerializationError, "Bad beacon magic");
    }

    WireFormat::Reader reader(data + sizeof(MAGIC), size - sizeof(MAGIC));
    uint8_t version = 0;
    uint16_t port = 0;
    uint16_t nameLen = 0;
    if (!reader.readU8(version) || !reader.readU16(port) || !reader.readU16(nameLen)) {
        return Err<DiscoveryBeacon>(ErrorCode::SerializationError, "Truncated beacon header");
    }

    if (version != VERSION) {
        return Err<DiscoveryBeacon>(ErrorCode::SerializationError,
                                    "Unsupported beacon version " + std::to_string(version));
    }
    if (reader.remaining() != nameLen) {
        return Err<DiscoveryBeacon>(ErrorCode::SerializationError,
                                    "Beacon name length " + std::to_string(nameLen) +
                                    " does not match payload (" + std::to_string(reader.remaining()) + " bytes)");
    }

    DiscoveryBeacon beacon;
    beacon.servicePort = port;
    if (!reader.readString(nameLen, beacon.displayName)) {
        return Err<DiscoveryBeacon>(ErrorCode::SerializationError, "Truncated beacon name");
    }
    if (auto check = checkFields(beacon.displayName, beacon.servicePort); !check) {
        return check.error();
    }
    return Ok(std::move(beacon));
}

Result<DiscoveryBeacon> DiscoveryBeacon::decode(const std::vector<uint8_t>& payload) {
    return decode(payload.data(), payload.size());
}

} // namespace PeerDrop
