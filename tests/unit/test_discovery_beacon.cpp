#include <gtest/gtest.h>

#include "DiscoveryBeacon.h"

using namespace PeerDrop;

namespace {

std::vector<uint8_t> encodeOrFail(const std::string& name, uint16_t port) {
    DiscoveryBeacon beacon{name, port};
    auto encoded = beacon.encode();
    EXPECT_TRUE(encoded.ok());
    return encoded.ok() ? *encoded : std::vector<uint8_t>{};
}

} // namespace

TEST(DiscoveryBeaconTest, EncodesFixedLayout) {
    auto bytes = encodeOrFail("laptop", 65432);

    const std::vector<uint8_t> expected = {
        'P', 'D', 'R', 'P',
        0x01,
        0xFF, 0x98,
        0x00, 0x06,
        'l', 'a', 'p', 't', 'o', 'p'
    };
    EXPECT_EQ(bytes, expected);
}

TEST(DiscoveryBeaconTest, DecodeRecoversFields) {
    auto decoded = DiscoveryBeacon::decode(encodeOrFail("K\xC3\xBC" "che", 7000));
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded->displayName, "K\xC3\xBC" "che");
    EXPECT_EQ(decoded->servicePort, 7000);
}

TEST(DiscoveryBeaconTest, RejectsBadMagicAndVersion) {
    auto bytes = encodeOrFail("desk", 65432);

    auto badMagic = bytes;
    badMagic[0] = 'X';
    auto r1 = DiscoveryBeacon::decode(badMagic);
    ASSERT_FALSE(r1.ok());
    EXPECT_EQ(r1.error().code, ErrorCode::SerializationError);

    auto badVersion = bytes;
    badVersion[4] = 2;
    auto r2 = DiscoveryBeacon::decode(badVersion);
    ASSERT_FALSE(r2.ok());
    EXPECT_EQ(r2.error().code, ErrorCode::SerializationError);
}

TEST(DiscoveryBeaconTest, RejectsLengthMismatch) {
    auto bytes = encodeOrFail("desk", 65432);

    auto truncated = bytes;
    truncated.pop_back();
    EXPECT_EQ(DiscoveryBeacon::decode(truncated).error().code, ErrorCode::SerializationError);

    auto extended = bytes;
    extended.push_back('!');
    EXPECT_EQ(DiscoveryBeacon::decode(extended).error().code, ErrorCode::SerializationError);

    std::vector<uint8_t> headerOnly(bytes.begin(), bytes.begin() + 5);
    EXPECT_EQ(DiscoveryBeacon::decode(headerOnly).error().code, ErrorCode::SerializationError);

    EXPECT_FALSE(DiscoveryBeacon::decode(std::vector<uint8_t>{}).ok());
}

TEST(DiscoveryBeaconTest, RejectsInvalidFields) {
    // Port 0 on the wire
    auto zeroPort = encodeOrFail("desk", 65432);
    zeroPort[5] = 0;
    zeroPort[6] = 0;
    EXPECT_EQ(DiscoveryBeacon::decode(zeroPort).error().code, ErrorCode::SerializationError);

    // Invalid UTF-8 in the name
    auto badUtf8 = encodeOrFail("desk", 65432);
    badUtf8.back() = 0xFF;
    EXPECT_EQ(DiscoveryBeacon::decode(badUtf8).error().code, ErrorCode::SerializationError);

    // Encoder refuses what the decoder would refuse
    EXPECT_FALSE((DiscoveryBeacon{"desk", 0}.encode().ok()));
    EXPECT_FALSE((DiscoveryBeacon{std::string(256, 'n'), 1}.encode().ok()));
    EXPECT_TRUE((DiscoveryBeacon{std::string(255, 'n'), 1}.encode().ok()));
}
