#include "ChunkCipher.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "WireFormat.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>  // For OPENSSL_cleanse
#include <fstream>
#include <memory>
#include <sstream>
#include <iomanip>

namespace PeerDrop {

namespace {

using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

constexpr size_t HASH_BUFFER_SIZE = 64 * 1024;

Result<EncryptedChunk> cryptoFailure(const std::string& what) {
    Logger::instance().log(LogLevel::ERROR, what, "ChunkCipher");
    MetricsCollector::instance().incrementEncryptionErrors();
    return Err<EncryptedChunk>(ErrorCode::CryptoError, what);
}

} // namespace

ChunkCipher::ChunkCipher(std::vector<uint8_t> key) : key_(std::move(key)) {}

ChunkCipher::~ChunkCipher() {
    if (!key_.empty()) {
        OPENSSL_cleanse(key_.data(), key_.size());
    }
}

Result<ChunkCipher> ChunkCipher::create(const std::vector<uint8_t>& key) {
    if (key.size() != KEY_SIZE) {
        Logger::instance().log(LogLevel::ERROR, "Invalid key size: " + std::to_string(key.size()), "ChunkCipher");
        return Err<ChunkCipher>(ErrorCode::ConfigurationError,
                                "Key must be " + std::to_string(KEY_SIZE) + " bytes, got " +
                                std::to_string(key.size()));
    }
    return Ok(ChunkCipher(key));
}

Result<std::vector<uint8_t>> ChunkCipher::generateKey() {
    auto& logger = Logger::instance();

    logger.log(LogLevel::DEBUG, "Generating encryption key", "ChunkCipher");

    std::vector<uint8_t> key(KEY_SIZE);
    if (RAND_bytes(key.data(), KEY_SIZE) != 1) {
        logger.log(LogLevel::ERROR, "Failed to generate random key", "ChunkCipher");
        MetricsCollector::instance().incrementEncryptionErrors();
        return Err<std::vector<uint8_t>>(ErrorCode::CryptoError, "Failed to generate random key");
    }
    return Ok(std::move(key));
}

Result<EncryptedChunk> ChunkCipher::encryptChunk(const std::vector<uint8_t>& plaintext) const {
    return encryptChunk(plaintext.data(), plaintext.size());
}

Result<EncryptedChunk> ChunkCipher::encryptChunk(const uint8_t* plaintext, size_t size) const {
    EncryptedChunk chunk;
    chunk.iv.resize(IV_SIZE);
    if (RAND_bytes(chunk.iv.data(), IV_SIZE) != 1) {
        return cryptoFailure("Failed to generate GCM nonce");
    }

    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        return cryptoFailure("Failed to create cipher context");
    }

    // Initialize AES-256-GCM encryption
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        return cryptoFailure("Failed to initialize GCM");
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, IV_SIZE, nullptr) != 1) {
        return cryptoFailure("Failed to set GCM IV length");
    }

    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), chunk.iv.data()) != 1) {
        return cryptoFailure("Failed to set GCM key/nonce");
    }

    // GCM is a stream mode: ciphertext is exactly as long as the plaintext
    chunk.ciphertext.resize(size);
    int len = 0;
    int ciphertextLen = 0;

    // An empty update would be taken as the final call, so skip it
    if (size > 0) {
        if (EVP_EncryptUpdate(ctx.get(), chunk.ciphertext.data(), &len, plaintext, static_cast<int>(size)) != 1) {
            return cryptoFailure("GCM encryption failed");
        }
        ciphertextLen = len;
    }

    if (EVP_EncryptFinal_ex(ctx.get(), chunk.ciphertext.data() + ciphertextLen, &len) != 1) {
        return cryptoFailure("GCM finalization failed");
    }
    ciphertextLen += len;
    chunk.ciphertext.resize(ciphertextLen);

    chunk.tag.resize(TAG_SIZE);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, TAG_SIZE, chunk.tag.data()) != 1) {
        return cryptoFailure("Failed to get GCM tag");
    }

    return Ok(std::move(chunk));
}

Result<std::vector<uint8_t>> ChunkCipher::decryptChunk(const std::vector<uint8_t>& iv,
                                                       const std::vector<uint8_t>& ciphertext,
                                                       const std::vector<uint8_t>& tag) const {
    auto& logger = Logger::instance();
    auto& metrics = MetricsCollector::instance();

    auto authFailure = [&](const std::string& what) {
        logger.log(LogLevel::WARN, what, "ChunkCipher");
        metrics.incrementAuthFailures();
        return Err<std::vector<uint8_t>>(ErrorCode::AuthenticationFailure, what);
    };

    if (iv.size() != IV_SIZE) {
        return authFailure("Invalid nonce size for GCM: " + std::to_string(iv.size()));
    }
    if (tag.size() != TAG_SIZE) {
        return authFailure("Invalid tag size for GCM: " + std::to_string(tag.size()));
    }

    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        metrics.incrementEncryptionErrors();
        return Err<std::vector<uint8_t>>(ErrorCode::CryptoError, "Failed to create cipher context");
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, IV_SIZE, nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), iv.data()) != 1) {
        metrics.incrementEncryptionErrors();
        return Err<std::vector<uint8_t>>(ErrorCode::CryptoError, "Failed to initialize GCM decryption");
    }

    std::vector<uint8_t> plaintext(ciphertext.size());
    int len = 0;
    int plaintextLen = 0;

    auto wipe = [&plaintext]() {
        if (!plaintext.empty()) {
            OPENSSL_cleanse(plaintext.data(), plaintext.size());
        }
        plaintext.clear();
    };

    if (!ciphertext.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext.data(),
                              static_cast<int>(ciphertext.size())) != 1) {
            wipe();
            return authFailure("GCM decryption failed");
        }
        plaintextLen = len;
    }

    // Set expected tag
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, TAG_SIZE,
                            const_cast<uint8_t*>(tag.data())) != 1) {
        wipe();
        return authFailure("Failed to set GCM tag");
    }

    // Verify tag
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintextLen, &len) != 1) {
        wipe();
        return authFailure("GCM authentication failed");
    }
    plaintextLen += len;
    plaintext.resize(plaintextLen);

    return Ok(std::move(plaintext));
}

std::vector<uint8_t> ChunkCipher::packFrame(const std::vector<uint8_t>& iv,
                                            const std::vector<uint8_t>& tag,
                                            const std::vector<uint8_t>& ciphertext) {
    std::vector<uint8_t> frame;
    frame.reserve(12 + iv.size() + tag.size() + ciphertext.size());
    WireFormat::appendU32(frame, static_cast<uint32_t>(iv.size()));
    WireFormat::appendBytes(frame, iv.data(), iv.size());
    WireFormat::appendU32(frame, static_cast<uint32_t>(tag.size()));
    WireFormat::appendBytes(frame, tag.data(), tag.size());
    WireFormat::appendU32(frame, static_cast<uint32_t>(ciphertext.size()));
    WireFormat::appendBytes(frame, ciphertext.data(), ciphertext.size());
    return frame;
}

std::vector<uint8_t> ChunkCipher::packFrame(const EncryptedChunk& chunk) {
    return packFrame(chunk.iv, chunk.tag, chunk.ciphertext);
}

Result<EncryptedChunk> ChunkCipher::unpackFrame(const std::vector<uint8_t>& frame) {
    WireFormat::Reader reader(frame);
    EncryptedChunk chunk;

    auto readField = [&reader](const char* name, std::vector<uint8_t>& out) -> Result<void> {
        uint32_t length = 0;
        if (!reader.readU32(length)) {
            return Err(ErrorCode::ProtocolError, std::string("Truncated ") + name + " length");
        }
        if (!reader.readBytes(length, out)) {
            return Err(ErrorCode::ProtocolError,
                       std::string(name) + " length " + std::to_string(length) + " exceeds frame");
        }
        return Ok();
    };

    if (auto r = readField("iv", chunk.iv); !r) return r.error();
    if (auto r = readField("tag", chunk.tag); !r) return r.error();
    if (auto r = readField("ciphertext", chunk.ciphertext); !r) return r.error();

    if (!reader.atEnd()) {
        return Err<EncryptedChunk>(ErrorCode::ProtocolError,
                                   std::to_string(reader.remaining()) + " trailing bytes after frame");
    }
    return Ok(std::move(chunk));
}

std::string ChunkCipher::checksum(const std::vector<uint8_t>& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;

    EVP_MD_CTX_ptr mdctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr);
    EVP_DigestUpdate(mdctx.get(), data.data(), data.size());
    EVP_DigestFinal_ex(mdctx.get(), hash, &hashLen);

    return toHex(std::vector<uint8_t>(hash, hash + hashLen));
}

Result<std::string> ChunkCipher::checksumFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err<std::string>(ErrorCode::FileError, "Cannot open file: " + path.string());
    }

    EVP_MD_CTX_ptr mdctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!mdctx || EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1) {
        return Err<std::string>(ErrorCode::CryptoError, "Failed to initialize SHA-256");
    }

    std::vector<char> buffer(HASH_BUFFER_SIZE);
    while (file) {
        file.read(buffer.data(), buffer.size());
        std::streamsize count = file.gcount();
        if (count > 0) {
            EVP_DigestUpdate(mdctx.get(), buffer.data(), static_cast<size_t>(count));
        }
    }
    if (file.bad()) {
        return Err<std::string>(ErrorCode::FileError, "Read error: " + path.string());
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    EVP_DigestFinal_ex(mdctx.get(), hash, &hashLen);
    return Ok(toHex(std::vector<uint8_t>(hash, hash + hashLen)));
}

std::string ChunkCipher::toHex(const std::vector<uint8_t>& data) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t byte : data) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

Result<std::vector<uint8_t>> ChunkCipher::fromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return Err<std::vector<uint8_t>>(ErrorCode::ConfigurationError, "Hex string has odd length");
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return Err<std::vector<uint8_t>>(ErrorCode::ConfigurationError, "Invalid hex digit");
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return Ok(std::move(bytes));
}

} // namespace PeerDrop
