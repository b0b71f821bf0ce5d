#include <gtest/gtest.h>

#include "SocketGuard.h"
#include "TransferProtocol.h"
#include "WireFormat.h"

#include <sys/socket.h>

using namespace PeerDrop;

namespace {

std::vector<uint8_t> rawHeader(const std::string& name, uint64_t size, uint32_t flag) {
    std::vector<uint8_t> out;
    WireFormat::appendU32(out, static_cast<uint32_t>(name.size()));
    WireFormat::appendBytes(out, name);
    WireFormat::appendU64(out, size);
    WireFormat::appendU32(out, flag);
    return out;
}

} // namespace

TEST(TransferHeaderTest, EncodeLayout) {
    TransferHeader header{"test.bin", 10000, false};
    auto bytes = TransferProtocol::encodeHeader(header);

    const std::vector<uint8_t> expected = {
        0x00, 0x00, 0x00, 0x08,
        't', 'e', 's', 't', '.', 'b', 'i', 'n',
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x27, 0x10,
        0x00, 0x00, 0x00, 0x00
    };
    EXPECT_EQ(bytes, expected);

    header.encrypted = true;
    EXPECT_EQ(TransferProtocol::encodeHeader(header).back(), 0x01);
}

TEST(TransferHeaderTest, DecodeAcceptsValidHeader) {
    auto decoded = TransferProtocol::decodeHeader(rawHeader("photo.jpg", 1ULL << 33, 1));
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded->fileName, "photo.jpg");
    EXPECT_EQ(decoded->fileSize, 1ULL << 33);
    EXPECT_TRUE(decoded->encrypted);
}

TEST(TransferHeaderTest, DecodeRejectsUnsafeNames) {
    const std::vector<std::string> names = {"../etc/passwd", "a/b.txt", "..", ".", "dir\\file", std::string("a\0b", 3)};
    for (const auto& name : names) {
        auto result = TransferProtocol::decodeHeader(rawHeader(name, 10, 0));
        ASSERT_FALSE(result.ok()) << name;
        EXPECT_EQ(result.error().code, ErrorCode::ProtocolError) << name;
    }
}

TEST(TransferHeaderTest, DecodeRejectsBadFields) {
    auto badFlag = TransferProtocol::decodeHeader(rawHeader("x.bin", 10, 2));
    ASSERT_FALSE(badFlag.ok());
    EXPECT_EQ(badFlag.error().code, ErrorCode::ProtocolError);

    auto emptyName = TransferProtocol::decodeHeader(rawHeader("", 10, 0));
    ASSERT_FALSE(emptyName.ok());
    EXPECT_EQ(emptyName.error().code, ErrorCode::ProtocolError);

    auto longName = TransferProtocol::decodeHeader(rawHeader(std::string(256, 'a'), 10, 0));
    ASSERT_FALSE(longName.ok());
    EXPECT_EQ(longName.error().code, ErrorCode::ProtocolError);

    auto badUtf8 = TransferProtocol::decodeHeader(rawHeader("bad\xFF.bin", 10, 0));
    ASSERT_FALSE(badUtf8.ok());
    EXPECT_EQ(badUtf8.error().code, ErrorCode::ProtocolError);

    auto truncated = rawHeader("x.bin", 10, 0);
    truncated.resize(truncated.size() - 2);
    auto r = TransferProtocol::decodeHeader(truncated);
    ASSERT_FALSE(r.ok());
    EXPECT_TRUE(isProtocolError(r.error().code));
}

class FrameReadTest : public ::testing::Test {
protected:
    void SetUp() override {
        int fds[2];
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
        reader_.reset(fds[0]);
        writer_.reset(fds[1]);
    }

    void write(const std::vector<uint8_t>& bytes) {
        ASSERT_TRUE(SocketIO::sendAll(writer_.get(), bytes.data(), bytes.size(), control_).ok());
    }

    IoControl control_{std::chrono::milliseconds(2000), nullptr};
    SocketGuard reader_;
    SocketGuard writer_;
};

TEST_F(FrameReadTest, ReadsWellFormedFrame) {
    std::vector<uint8_t> iv(12, 1), tag(16, 2), ct(100, 3);
    write(ChunkCipher::packFrame(iv, tag, ct));

    auto frame = TransferProtocol::readFrame(reader_.get(), 4096, control_);
    ASSERT_TRUE(frame.ok()) << frame.error().describe();
    EXPECT_EQ(frame->iv, iv);
    EXPECT_EQ(frame->tag, tag);
    EXPECT_EQ(frame->ciphertext, ct);
}

TEST_F(FrameReadTest, RejectsWrongIvLength) {
    write(ChunkCipher::packFrame(std::vector<uint8_t>(11, 1), std::vector<uint8_t>(16, 2), std::vector<uint8_t>(10, 3)));

    auto frame = TransferProtocol::readFrame(reader_.get(), 4096, control_);
    ASSERT_FALSE(frame.ok());
    EXPECT_EQ(frame.error().code, ErrorCode::ProtocolError);
}

TEST_F(FrameReadTest, RejectsWrongTagLength) {
    write(ChunkCipher::packFrame(std::vector<uint8_t>(12, 1), std::vector<uint8_t>(8, 2), std::vector<uint8_t>(10, 3)));

    auto frame = TransferProtocol::readFrame(reader_.get(), 4096, control_);
    ASSERT_FALSE(frame.ok());
    EXPECT_EQ(frame.error().code, ErrorCode::ProtocolError);
}

TEST_F(FrameReadTest, RejectsCiphertextBeyondRemaining) {
    write(ChunkCipher::packFrame(std::vector<uint8_t>(12, 1), std::vector<uint8_t>(16, 2), std::vector<uint8_t>(100, 3)));

    auto frame = TransferProtocol::readFrame(reader_.get(), 50, control_);
    ASSERT_FALSE(frame.ok());
    EXPECT_EQ(frame.error().code, ErrorCode::ProtocolError);
}

TEST_F(FrameReadTest, RejectsEmptyCiphertext) {
    write(ChunkCipher::packFrame(std::vector<uint8_t>(12, 1), std::vector<uint8_t>(16, 2), std::vector<uint8_t>()));

    auto frame = TransferProtocol::readFrame(reader_.get(), 50, control_);
    ASSERT_FALSE(frame.ok());
    EXPECT_EQ(frame.error().code, ErrorCode::ProtocolError);
}

TEST_F(FrameReadTest, PrematureCloseIsConnectionClosed) {
    auto bytes = ChunkCipher::packFrame(std::vector<uint8_t>(12, 1), std::vector<uint8_t>(16, 2),
                                        std::vector<uint8_t>(100, 3));
    bytes.resize(bytes.size() - 10);
    write(bytes);
    writer_.reset();

    auto frame = TransferProtocol::readFrame(reader_.get(), 4096, control_);
    ASSERT_FALSE(frame.ok());
    EXPECT_EQ(frame.error().code, ErrorCode::ConnectionClosed);
    EXPECT_TRUE(isProtocolError(frame.error().code));
}

TEST_F(FrameReadTest, ReadHeaderFromSocket) {
    write(rawHeader("notes.txt", 42, 0));

    auto header = TransferProtocol::readHeader(reader_.get(), control_);
    ASSERT_TRUE(header.ok()) << header.error().describe();
    EXPECT_EQ(header->fileName, "notes.txt");
    EXPECT_EQ(header->fileSize, 42u);
    EXPECT_FALSE(header->encrypted);
}

TEST_F(FrameReadTest, ReadHeaderRejectsOversizedNameBeforeReadingIt) {
    std::vector<uint8_t> bytes;
    WireFormat::appendU32(bytes, 0x10000000);
    write(bytes);

    auto header = TransferProtocol::readHeader(reader_.get(), control_);
    ASSERT_FALSE(header.ok());
    EXPECT_EQ(header.error().code, ErrorCode::ProtocolError);
}
