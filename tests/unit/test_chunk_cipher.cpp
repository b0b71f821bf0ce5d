#include <gtest/gtest.h>

#include "ChunkCipher.h"
#include "MetricsCollector.h"

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace PeerDrop;

namespace {

std::vector<uint8_t> patternBytes(size_t size, uint8_t seed = 0) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>((i * 31 + seed) & 0xFF);
    }
    return data;
}

ChunkCipher makeCipher() {
    auto key = ChunkCipher::generateKey();
    EXPECT_TRUE(key.ok());
    auto cipher = ChunkCipher::create(*key);
    EXPECT_TRUE(cipher.ok());
    return std::move(*cipher);
}

} // namespace

class ChunkCipherTest : public ::testing::Test {
protected:
    ChunkCipher cipher_ = makeCipher();
};

TEST(ChunkCipherKeyTest, CreateRequires32ByteKey) {
    auto short16 = ChunkCipher::create(std::vector<uint8_t>(16, 0x01));
    ASSERT_FALSE(short16.ok());
    EXPECT_EQ(short16.error().code, ErrorCode::ConfigurationError);

    auto long33 = ChunkCipher::create(std::vector<uint8_t>(33, 0x01));
    ASSERT_FALSE(long33.ok());
    EXPECT_EQ(long33.error().code, ErrorCode::ConfigurationError);

    EXPECT_TRUE(ChunkCipher::create(std::vector<uint8_t>(32, 0x01)).ok());
}

TEST(ChunkCipherKeyTest, GeneratedKeysAreFresh) {
    auto key1 = ChunkCipher::generateKey();
    auto key2 = ChunkCipher::generateKey();
    ASSERT_TRUE(key1.ok());
    ASSERT_TRUE(key2.ok());
    EXPECT_EQ(key1->size(), ChunkCipher::KEY_SIZE);
    EXPECT_NE(*key1, *key2);
}

TEST(ChunkCipherKeyTest, RoundTripAcrossKeysAndLengths) {
    for (int k = 0; k < 3; ++k) {
        ChunkCipher cipher = makeCipher();
        for (size_t len : {0u, 1u, 15u, 16u, 17u, 255u, 4096u, 5000u}) {
            auto plaintext = patternBytes(len, static_cast<uint8_t>(k));
            auto chunk = cipher.encryptChunk(plaintext);
            ASSERT_TRUE(chunk.ok()) << "len " << len;
            EXPECT_EQ(chunk->iv.size(), ChunkCipher::IV_SIZE);
            EXPECT_EQ(chunk->tag.size(), ChunkCipher::TAG_SIZE);
            EXPECT_EQ(chunk->ciphertext.size(), len);

            auto decrypted = cipher.decryptChunk(chunk->iv, chunk->ciphertext, chunk->tag);
            ASSERT_TRUE(decrypted.ok()) << "len " << len;
            EXPECT_EQ(*decrypted, plaintext);
        }
    }
}

TEST_F(ChunkCipherTest, FreshIvPerChunk) {
    auto plaintext = patternBytes(64);
    auto a = cipher_.encryptChunk(plaintext);
    auto b = cipher_.encryptChunk(plaintext);
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_NE(a->iv, b->iv);
    EXPECT_NE(a->ciphertext, b->ciphertext);
}

TEST_F(ChunkCipherTest, BitFlipsFailAuthentication) {
    auto plaintext = patternBytes(100);
    auto chunk = cipher_.encryptChunk(plaintext);
    ASSERT_TRUE(chunk.ok());

    auto before = MetricsCollector::instance().getSecurityMetrics().authFailures;

    auto ivFlipped = *chunk;
    ivFlipped.iv[3] ^= 0x01;
    auto r1 = cipher_.decryptChunk(ivFlipped.iv, ivFlipped.ciphertext, ivFlipped.tag);
    ASSERT_FALSE(r1.ok());
    EXPECT_EQ(r1.error().code, ErrorCode::AuthenticationFailure);

    auto tagFlipped = *chunk;
    tagFlipped.tag[15] ^= 0x80;
    auto r2 = cipher_.decryptChunk(tagFlipped.iv, tagFlipped.ciphertext, tagFlipped.tag);
    ASSERT_FALSE(r2.ok());
    EXPECT_EQ(r2.error().code, ErrorCode::AuthenticationFailure);

    auto ctFlipped = *chunk;
    ctFlipped.ciphertext[0] ^= 0x01;
    auto r3 = cipher_.decryptChunk(ctFlipped.iv, ctFlipped.ciphertext, ctFlipped.tag);
    ASSERT_FALSE(r3.ok());
    EXPECT_EQ(r3.error().code, ErrorCode::AuthenticationFailure);

    EXPECT_GE(MetricsCollector::instance().getSecurityMetrics().authFailures, before + 3);
}

TEST_F(ChunkCipherTest, WrongKeyFailsAuthentication) {
    auto chunk = cipher_.encryptChunk(patternBytes(32));
    ASSERT_TRUE(chunk.ok());

    ChunkCipher other = makeCipher();
    auto result = other.decryptChunk(chunk->iv, chunk->ciphertext, chunk->tag);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::AuthenticationFailure);
}

TEST_F(ChunkCipherTest, WrongIvOrTagSizeFailsAuthentication) {
    auto chunk = cipher_.encryptChunk(patternBytes(32));
    ASSERT_TRUE(chunk.ok());

    std::vector<uint8_t> shortIv(chunk->iv.begin(), chunk->iv.end() - 1);
    auto r1 = cipher_.decryptChunk(shortIv, chunk->ciphertext, chunk->tag);
    ASSERT_FALSE(r1.ok());
    EXPECT_EQ(r1.error().code, ErrorCode::AuthenticationFailure);

    std::vector<uint8_t> shortTag(chunk->tag.begin(), chunk->tag.begin() + 12);
    auto r2 = cipher_.decryptChunk(chunk->iv, chunk->ciphertext, shortTag);
    ASSERT_FALSE(r2.ok());
    EXPECT_EQ(r2.error().code, ErrorCode::AuthenticationFailure);
}

TEST(ChunkFrameTest, PackLayout) {
    std::vector<uint8_t> iv(12, 0xAA);
    std::vector<uint8_t> tag(16, 0xBB);
    std::vector<uint8_t> ct(300, 0xCC);

    auto frame = ChunkCipher::packFrame(iv, tag, ct);
    ASSERT_EQ(frame.size(), 4u + 12 + 4 + 16 + 4 + 300);

    // [u32 12][iv][u32 16][tag][u32 300][ct]
    EXPECT_EQ(frame[3], 12);
    EXPECT_EQ(frame[4], 0xAA);
    EXPECT_EQ(frame[16 + 3], 16);
    EXPECT_EQ(frame[20], 0xBB);
    EXPECT_EQ(frame[36], 0x00);
    EXPECT_EQ(frame[37], 0x00);
    EXPECT_EQ(frame[38], 0x01);
    EXPECT_EQ(frame[39], 0x2C);
    EXPECT_EQ(frame[40], 0xCC);
}

TEST(ChunkFrameTest, UnpackInvertsPack) {
    EncryptedChunk chunk{std::vector<uint8_t>(12, 1), patternBytes(70000), std::vector<uint8_t>(16, 2)};

    auto unpacked = ChunkCipher::unpackFrame(ChunkCipher::packFrame(chunk));
    ASSERT_TRUE(unpacked.ok());
    EXPECT_EQ(*unpacked, chunk);
}

TEST(ChunkFrameTest, UnpackRejectsMalformedFrames) {
    auto frame = ChunkCipher::packFrame(std::vector<uint8_t>(12, 1), std::vector<uint8_t>(16, 2), patternBytes(10));

    auto truncated = frame;
    truncated.pop_back();
    auto r1 = ChunkCipher::unpackFrame(truncated);
    ASSERT_FALSE(r1.ok());
    EXPECT_EQ(r1.error().code, ErrorCode::ProtocolError);

    auto trailing = frame;
    trailing.push_back(0);
    auto r2 = ChunkCipher::unpackFrame(trailing);
    ASSERT_FALSE(r2.ok());
    EXPECT_EQ(r2.error().code, ErrorCode::ProtocolError);

    auto overlong = frame;
    overlong[0] = 0x7F;   // iv length far beyond the buffer
    auto r3 = ChunkCipher::unpackFrame(overlong);
    ASSERT_FALSE(r3.ok());
    EXPECT_EQ(r3.error().code, ErrorCode::ProtocolError);

    auto r4 = ChunkCipher::unpackFrame({0x00, 0x00});
    ASSERT_FALSE(r4.ok());
    EXPECT_EQ(r4.error().code, ErrorCode::ProtocolError);
}

TEST(ChunkChecksumTest, KnownDigest) {
    std::string abc = "abc";
    EXPECT_EQ(ChunkCipher::checksum(std::vector<uint8_t>(abc.begin(), abc.end())),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(ChunkCipher::checksum({}),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(ChunkChecksumTest, FileDigestMatchesBufferDigest) {
    auto path = std::filesystem::temp_directory_path() /
                ("peerdrop_checksum_" + std::to_string(getpid()) + ".bin");
    auto data = patternBytes(200000);
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    auto digest = ChunkCipher::checksumFile(path);
    ASSERT_TRUE(digest.ok());
    EXPECT_EQ(*digest, ChunkCipher::checksum(data));
    std::filesystem::remove(path);

    auto missing = ChunkCipher::checksumFile(path);
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code, ErrorCode::FileError);
}

TEST(ChunkHexTest, HexConversion) {
    std::vector<uint8_t> bytes = {0x00, 0x7f, 0xab, 0xff};
    EXPECT_EQ(ChunkCipher::toHex(bytes), "007fabff");

    auto parsed = ChunkCipher::fromHex("007FABff");
    ASSERT_TRUE(parsed.ok());
    EXPECT_EQ(*parsed, bytes);

    EXPECT_FALSE(ChunkCipher::fromHex("abc").ok());
    EXPECT_FALSE(ChunkCipher::fromHex("zz").ok());
}
