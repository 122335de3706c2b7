#include <gtest/gtest.h>

#include <array>
#include <vector>

#include "unchunk/chunk/header.hpp"

namespace unchunk {
namespace {

TEST(HeaderTest, SerializeRoundTrip) {
    ChunkHeader header;
    header.id = 42;
    header.serial = 5;
    header.end_of_message = false;

    auto bytes = serialize_header(header);
    auto parsed = parse_header(bytes);

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->id, 42u);
    EXPECT_EQ(parsed->serial, 5u);
    EXPECT_FALSE(parsed->end_of_message);
}

TEST(HeaderTest, WireLayoutIsBigEndian) {
    ChunkHeader header;
    header.id = 0x01020304;
    header.serial = 0xA0B0C0D0;
    header.end_of_message = true;

    auto bytes = serialize_header(header);
    std::array<uint8_t, ChunkHeader::SIZE> expected = {
        0x01,
        0x01, 0x02, 0x03, 0x04,
        0xA0, 0xB0, 0xC0, 0xD0
    };
    EXPECT_EQ(bytes, expected);
}

TEST(HeaderTest, ReservedOptionBitsIgnored) {
    std::array<uint8_t, ChunkHeader::SIZE> bytes = {0xFE, 0, 0, 0, 1, 0, 0, 0, 2};
    auto parsed = parse_header(bytes);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_FALSE(parsed->end_of_message);
    EXPECT_EQ(parsed->id, 1u);
    EXPECT_EQ(parsed->serial, 2u);

    bytes[0] = 0xFF;
    parsed = parse_header(bytes);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->end_of_message);
}

TEST(HeaderTest, TooShortRejected) {
    std::array<uint8_t, 8> short_data{};
    EXPECT_FALSE(parse_header(short_data).has_value());
    EXPECT_FALSE(parse_header({}).has_value());
}

TEST(HeaderTest, EncodeChunkPrependsHeader) {
    std::vector<uint8_t> payload = {0xDE, 0xAD, 0xBE, 0xEF};
    auto chunk = encode_chunk(42, 5, false, payload);

    ASSERT_EQ(chunk.size(), ChunkHeader::SIZE + payload.size());
    auto parsed = parse_header(chunk);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->id, 42u);
    EXPECT_EQ(parsed->serial, 5u);
    EXPECT_FALSE(parsed->end_of_message);
    EXPECT_EQ(std::vector<uint8_t>(chunk.begin() + ChunkHeader::SIZE, chunk.end()), payload);
}

TEST(HeaderTest, EncodeEmptyPayload) {
    auto chunk = encode_chunk(0xFFFFFFFF, 0xFFFFFFFF, true, {});
    ASSERT_EQ(chunk.size(), ChunkHeader::SIZE);
    auto parsed = parse_header(chunk);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->id, 0xFFFFFFFFu);
    EXPECT_EQ(parsed->serial, 0xFFFFFFFFu);
    EXPECT_TRUE(parsed->end_of_message);
}

}  // namespace
}  // namespace unchunk
