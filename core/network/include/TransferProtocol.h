#pragma once

#include "ChunkCipher.h"
#include "Result.h"
#include "SocketIO.h"

#include <cstdint>
#include <string>
#include <vector>

namespace PeerDrop {

/**
 * @brief First bytes on every transfer connection
 *
 * [u32 fileNameLen][fileName UTF-8][u64 fileSize][u32 encryptedFlag]
 */
struct TransferHeader {
    std::string fileName;
    uint64_t fileSize = 0;
    bool encrypted = false;
};

namespace TransferProtocol {

    std::vector<uint8_t> encodeHeader(const TransferHeader& header);

    /// Parse a header held in memory (must contain exactly one header)
    Result<TransferHeader> decodeHeader(const std::vector<uint8_t>& bytes);

    /// Four exact-length reads from the socket, then validation
    Result<TransferHeader> readHeader(int fd, const IoControl& control);

    /**
     * @brief Read one [ivLen][iv][tagLen][tag][ctLen][ct] frame
     * @param remaining Plaintext bytes still expected; bounds the ciphertext length
     */
    Result<EncryptedChunk> readFrame(int fd, uint64_t remaining, const IoControl& control);

} // namespace TransferProtocol

} // namespace PeerDrop
