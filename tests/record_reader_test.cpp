#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "unchunk/io/record_reader.hpp"

namespace unchunk::io {
namespace {

std::stringstream make_stream(const std::vector<std::vector<uint8_t>>& records) {
    std::stringstream stream;
    for (const auto& record : records) {
        EXPECT_TRUE(write_record(stream, record));
    }
    return stream;
}

TEST(RecordReaderTest, ReadsRecordsInOrder) {
    std::vector<std::vector<uint8_t>> records = {{0x01, 0x02}, {}, {0x03}};
    auto stream = make_stream(records);
    RecordReader reader(stream);

    for (const auto& expected : records) {
        RecordError error = RecordError::END_OF_STREAM;
        auto record = reader.next(&error);
        ASSERT_TRUE(record.has_value());
        EXPECT_EQ(error, RecordError::SUCCESS);
        EXPECT_EQ(*record, expected);
    }

    RecordError error = RecordError::SUCCESS;
    EXPECT_FALSE(reader.next(&error).has_value());
    EXPECT_EQ(error, RecordError::END_OF_STREAM);
    EXPECT_EQ(reader.records_read(), 3u);
}

TEST(RecordReaderTest, LengthPrefixIsBigEndian) {
    std::stringstream stream;
    write_record(stream, std::vector<uint8_t>(0x0102, 0xAA));
    std::string bytes = stream.str();
    ASSERT_EQ(bytes.size(), 4u + 0x0102);
    EXPECT_EQ(static_cast<uint8_t>(bytes[0]), 0x00);
    EXPECT_EQ(static_cast<uint8_t>(bytes[1]), 0x00);
    EXPECT_EQ(static_cast<uint8_t>(bytes[2]), 0x01);
    EXPECT_EQ(static_cast<uint8_t>(bytes[3]), 0x02);
}

TEST(RecordReaderTest, SkipReportsOffsets) {
    std::vector<std::vector<uint8_t>> records = {{0x01, 0x02, 0x03}, {0x04}};
    auto stream = make_stream(records);
    RecordReader reader(stream);

    auto first = reader.skip();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->offset, 4u);
    EXPECT_EQ(first->length, 3u);

    auto second = reader.skip();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->offset, 11u);
    EXPECT_EQ(second->length, 1u);

    RecordError error = RecordError::SUCCESS;
    EXPECT_FALSE(reader.skip(&error).has_value());
    EXPECT_EQ(error, RecordError::END_OF_STREAM);
}

TEST(RecordReaderTest, TruncatedLength) {
    std::stringstream stream(std::string("\x00\x00", 2));
    RecordReader reader(stream);

    RecordError error = RecordError::SUCCESS;
    EXPECT_FALSE(reader.next(&error).has_value());
    EXPECT_EQ(error, RecordError::TRUNCATED_LENGTH);
}

TEST(RecordReaderTest, TruncatedRecord) {
    std::stringstream stream(std::string("\x00\x00\x00\x05\x01\x02", 6));
    RecordReader reader(stream);

    RecordError error = RecordError::SUCCESS;
    EXPECT_FALSE(reader.next(&error).has_value());
    EXPECT_EQ(error, RecordError::TRUNCATED_RECORD);

    std::stringstream again(std::string("\x00\x00\x00\x05\x01\x02", 6));
    RecordReader skipper(again);
    EXPECT_FALSE(skipper.skip(&error).has_value());
    EXPECT_EQ(error, RecordError::TRUNCATED_RECORD);
}

TEST(RecordReaderTest, OversizedRecordRejected) {
    auto stream = make_stream({std::vector<uint8_t>(100, 0)});
    RecordReader reader(stream, 64);

    RecordError error = RecordError::SUCCESS;
    EXPECT_FALSE(reader.next(&error).has_value());
    EXPECT_EQ(error, RecordError::RECORD_TOO_LARGE);
}

}  // namespace
}  // namespace unchunk::io
