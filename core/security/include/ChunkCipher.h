#pragma once

#include "Result.h"

#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace PeerDrop {

/**
 * @brief One AES-256-GCM encrypted chunk as it travels on the wire
 */
struct EncryptedChunk {
    std::vector<uint8_t> iv;
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> tag;

    bool operator==(const EncryptedChunk& other) const {
        return iv == other.iv && ciphertext == other.ciphertext && tag == other.tag;
    }
};

/**
 * @brief Authenticated encryption of individual file chunks
 *
 * Every chunk gets a fresh random 96-bit IV and a 128-bit tag; chunks are
 * independent of one another, so a receiver can verify and write them one
 * at a time. The key is wiped from memory when the cipher is destroyed.
 */
class ChunkCipher {
public:
    static constexpr size_t KEY_SIZE = 32;      // 256 bits
    static constexpr size_t IV_SIZE = 12;       // 96 bits, GCM standard
    static constexpr size_t TAG_SIZE = 16;      // 128 bits

    /**
     * @brief Build a cipher around a raw key
     * @return ConfigurationError unless the key is exactly KEY_SIZE bytes
     */
    static Result<ChunkCipher> create(const std::vector<uint8_t>& key);

    /**
     * @brief 32 bytes from the OpenSSL CSPRNG
     */
    static Result<std::vector<uint8_t>> generateKey();

    ChunkCipher(const ChunkCipher&) = default;
    ChunkCipher& operator=(const ChunkCipher&) = default;
    ChunkCipher(ChunkCipher&&) = default;
    ChunkCipher& operator=(ChunkCipher&&) = default;
    ~ChunkCipher();

    Result<EncryptedChunk> encryptChunk(const std::vector<uint8_t>& plaintext) const;
    Result<EncryptedChunk> encryptChunk(const uint8_t* plaintext, size_t size) const;

    /**
     * @brief Verify and decrypt one chunk
     * @return AuthenticationFailure if the tag does not verify or the iv/tag
     *         sizes are wrong. No plaintext is ever returned on failure.
     */
    Result<std::vector<uint8_t>> decryptChunk(const std::vector<uint8_t>& iv,
                                              const std::vector<uint8_t>& ciphertext,
                                              const std::vector<uint8_t>& tag) const;

    /**
     * @brief Serialize as [u32 ivLen][iv][u32 tagLen][tag][u32 ctLen][ct]
     */
    static std::vector<uint8_t> packFrame(const std::vector<uint8_t>& iv,
                                          const std::vector<uint8_t>& tag,
                                          const std::vector<uint8_t>& ciphertext);
    static std::vector<uint8_t> packFrame(const EncryptedChunk& chunk);

    /// ProtocolError on truncation, overlong lengths or trailing bytes
    static Result<EncryptedChunk> unpackFrame(const std::vector<uint8_t>& frame);

    /// SHA-256 hex digest
    static std::string checksum(const std::vector<uint8_t>& data);
    static Result<std::string> checksumFile(const std::filesystem::path& path);

    static std::string toHex(const std::vector<uint8_t>& data);
    static Result<std::vector<uint8_t>> fromHex(const std::string& hex);

private:
    explicit ChunkCipher(std::vector<uint8_t> key);

    std::vector<uint8_t> key_;
};

} // namespace PeerDrop
