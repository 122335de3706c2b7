#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <vector>

#include "unchunk/chunk/blob.hpp"

namespace unchunk {
namespace {

// Part whose reads always fail, like a file that went away
class FailingPart : public BlobPart {
public:
    explicit FailingPart(size_t size) : size_(size) {}

    size_t size() const override { return size_; }
    bool read(size_t, std::span<uint8_t>) const override { return false; }

private:
    size_t size_;
};

class BlobTest : public ::testing::Test {
protected:
    std::vector<uint8_t> first = {0x01, 0x02, 0x03, 0x04};
    std::vector<uint8_t> second = {0x05, 0x06, 0x07};
};

TEST_F(BlobTest, FromBytesCopies) {
    auto blob = Blob::from_bytes(first);
    first[0] = 0xFF;

    auto data = blob.read_all();
    ASSERT_TRUE(data.has_value());
    std::vector<uint8_t> expected = {0x01, 0x02, 0x03, 0x04};
    EXPECT_EQ(*data, expected);
}

TEST_F(BlobTest, EmptyBlob) {
    Blob blob;
    EXPECT_TRUE(blob.empty());
    EXPECT_EQ(blob.segment_count(), 0u);
    auto data = blob.read_all();
    ASSERT_TRUE(data.has_value());
    EXPECT_TRUE(data->empty());
}

TEST_F(BlobTest, ConcatKeepsSegments) {
    auto a = Blob::from_bytes(first);
    auto b = Blob::from_bytes(second);
    std::vector<const Blob*> parts = {&a, &b};

    auto joined = Blob::concat(parts);
    EXPECT_EQ(joined.size(), 7u);
    EXPECT_EQ(joined.segment_count(), 2u);

    auto data = joined.read_all();
    ASSERT_TRUE(data.has_value());
    std::vector<uint8_t> expected = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07};
    EXPECT_EQ(*data, expected);
}

TEST_F(BlobTest, SliceAcrossSegments) {
    auto a = Blob::from_bytes(first);
    auto b = Blob::from_bytes(second);
    std::vector<const Blob*> parts = {&a, &b};
    auto joined = Blob::concat(parts);

    auto middle = joined.slice(2, 6);
    EXPECT_EQ(middle.size(), 4u);
    EXPECT_EQ(middle.segment_count(), 2u);

    auto data = middle.read_all();
    ASSERT_TRUE(data.has_value());
    std::vector<uint8_t> expected = {0x03, 0x04, 0x05, 0x06};
    EXPECT_EQ(*data, expected);
}

TEST_F(BlobTest, SliceClamped) {
    auto blob = Blob::from_bytes(first);
    EXPECT_EQ(blob.slice(2, 100).size(), 2u);
    EXPECT_EQ(blob.slice(10, 20).size(), 0u);
    EXPECT_EQ(blob.slice(3, 1).size(), 0u);
}

TEST_F(BlobTest, ReadOutOfBoundsFails) {
    auto blob = Blob::from_bytes(first);
    std::vector<uint8_t> out(3);
    EXPECT_TRUE(blob.read(1, out));
    EXPECT_FALSE(blob.read(2, out));
}

TEST_F(BlobTest, FailingPartReported) {
    Blob blob(std::make_shared<FailingPart>(16));
    EXPECT_EQ(blob.size(), 16u);
    EXPECT_FALSE(blob.read_all().has_value());

    std::ostringstream out;
    EXPECT_FALSE(blob.write_to(out));
}

TEST_F(BlobTest, FileBackedRange) {
    auto path = std::filesystem::temp_directory_path() / "unchunk_blob_test.bin";
    {
        std::ofstream file(path, std::ios::binary);
        const char content[] = "0123456789";
        file.write(content, 10);
    }

    auto blob = Blob::from_file(path.string(), 2, 5);
    auto data = blob.read_all();
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(std::string(data->begin(), data->end()), "23456");

    auto whole = Blob::from_file(path.string());
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(whole->size(), 10u);

    std::ostringstream out;
    EXPECT_TRUE(whole->slice(5, 10).write_to(out));
    EXPECT_EQ(out.str(), "56789");

    std::filesystem::remove(path);
}

TEST_F(BlobTest, MissingFileFails) {
    EXPECT_FALSE(Blob::from_file("/nonexistent/unchunk/file.bin").has_value());

    auto blob = Blob::from_file("/nonexistent/unchunk/file.bin", 0, 4);
    EXPECT_FALSE(blob.read_all().has_value());
}

}  // namespace
}  // namespace unchunk
