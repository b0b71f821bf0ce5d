#include "TransferProtocol.h"
#include "Constants.h"
#include "PathValidator.h"
#include "WireFormat.h"
#include <algorithm>

namespace PeerDrop {

namespace TransferProtocol {

namespace {

Result<void> checkNameLength(uint32_t length) {
    if (length == 0 || length > config::MAX_FILENAME_LENGTH) {
        return Err(ErrorCode::ProtocolError, "Invalid file name length " + std::to_string(length));
    }
    return Ok();
}

Result<TransferHeader> finishHeader(std::string rawName, uint64_t fileSize, uint32_t flag) {
    auto name = PathValidator::sanitizeFileName(rawName);
    if (!name) {
        return name.error();
    }
    if (flag > 1) {
        return Err<TransferHeader>(ErrorCode::ProtocolError, "Invalid encrypted flag " + std::to_string(flag));
    }

    TransferHeader header;
    header.fileName = std::move(*name);
    header.fileSize = fileSize;
    header.encrypted = (flag == 1);
    return Ok(std::move(header));
}

Result<uint32_t> readLength(int fd, const char* field, uint32_t expectedMin, uint64_t expectedMax,
                            const IoControl& control) {
    uint8_t raw[4];
    if (auto r = SocketIO::recvExact(fd, raw, sizeof(raw), control); !r) {
        return r.error();
    }
    uint32_t length = WireFormat::readU32(raw);
    if (length < expectedMin || length > expectedMax) {
        return Err<uint32_t>(ErrorCode::ProtocolError,
                             std::string("Invalid ") + field + " length " + std::to_string(length));
    }
    return Ok(length);
}

} // namespace

std::vector<uint8_t> encodeHeader(const TransferHeader& header) {
    std::vector<uint8_t> out;
    out.reserve(16 + header.fileName.size());
    WireFormat::appendU32(out, static_cast<uint32_t>(header.fileName.size()));
    WireFormat::appendBytes(out, header.fileName);
    WireFormat::appendU64(out, header.fileSize);
    WireFormat::appendU32(out, header.encrypted ? 1 : 0);
    return out;
}

Result<TransferHeader> decodeHeader(const std::vector<uint8_t>& bytes) {
    WireFormat::Reader reader(bytes);

    uint32_t nameLen = 0;
    if (!reader.readU32(nameLen)) {
        return Err<TransferHeader>(ErrorCode::ConnectionClosed, "Truncated header");
    }
    if (auto r = checkNameLength(nameLen); !r) {
        return r.error();
    }

    std::string name;
    uint64_t fileSize = 0;
    uint32_t flag = 0;
    if (!reader.readString(nameLen, name) || !reader.readU64(fileSize) || !reader.readU32(flag)) {
        return Err<TransferHeader>(ErrorCode::ConnectionClosed, "Truncated header");
    }
    if (!reader.atEnd()) {
        return Err<TransferHeader>(ErrorCode::ProtocolError, "Trailing bytes after header");
    }
    return finishHeader(std::move(name), fileSize, flag);
}

Result<TransferHeader> readHeader(int fd, const IoControl& control) {
    uint8_t lengthBytes[4];
    if (auto r = SocketIO::recvExact(fd, lengthBytes, sizeof(lengthBytes), control); !r) {
        return r.error();
    }
    uint32_t nameLen = WireFormat::readU32(lengthBytes);
    if (auto r = checkNameLength(nameLen); !r) {
        return r.error();
    }

    std::string name(nameLen, '\0');
    if (auto r = SocketIO::recvExact(fd, reinterpret_cast<uint8_t*>(&name[0]), nameLen, control); !r) {
        return r.error();
    }

    uint8_t sizeBytes[8];
    if (auto r = SocketIO::recvExact(fd, sizeBytes, sizeof(sizeBytes), control); !r) {
        return r.error();
    }

    uint8_t flagBytes[4];
    if (auto r = SocketIO::recvExact(fd, flagBytes, sizeof(flagBytes), control); !r) {
        return r.error();
    }

    return finishHeader(std::move(name), WireFormat::readU64(sizeBytes), WireFormat::readU32(flagBytes));
}

Result<EncryptedChunk> readFrame(int fd, uint64_t remaining, const IoControl& control) {
    EncryptedChunk chunk;

    auto ivLen = readLength(fd, "iv", ChunkCipher::IV_SIZE, ChunkCipher::IV_SIZE, control);
    if (!ivLen) return ivLen.error();
    chunk.iv.resize(*ivLen);
    if (auto r = SocketIO::recvExact(fd, chunk.iv.data(), chunk.iv.size(), control); !r) {
        return r.error();
    }

    auto tagLen = readLength(fd, "tag", ChunkCipher::TAG_SIZE, ChunkCipher::TAG_SIZE, control);
    if (!tagLen) return tagLen.error();
    chunk.tag.resize(*tagLen);
    if (auto r = SocketIO::recvExact(fd, chunk.tag.data(), chunk.tag.size(), control); !r) {
        return r.error();
    }

    const uint64_t maxCiphertext = std::min<uint64_t>(remaining, config::MAX_FRAME_PAYLOAD);
    auto ctLen = readLength(fd, "ciphertext", 1, maxCiphertext, control);
    if (!ctLen) return ctLen.error();
    chunk.ciphertext.resize(*ctLen);
    if (auto r = SocketIO::recvExact(fd, chunk.ciphertext.data(), chunk.ciphertext.size(), control); !r) {
        return r.error();
    }

    return Ok(std::move(chunk));
}

} // namespace TransferProtocol

} // namespace PeerDrop
