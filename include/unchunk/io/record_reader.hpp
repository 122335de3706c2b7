#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <span>
#include <vector>

namespace unchunk::io {

// Record stream format: repeated [length: u32 big-endian][length bytes]
// Each record holds one raw chunk as it came off the transport.

enum class RecordError {
    SUCCESS,
    END_OF_STREAM,     // Clean end, no partial record
    TRUNCATED_LENGTH,  // Stream ended inside a length prefix
    TRUNCATED_RECORD,  // Stream ended inside a record body
    RECORD_TOO_LARGE   // Length prefix exceeds the configured limit
};

const char* record_error_to_string(RecordError error);

// Location of a record body inside the stream
struct RecordInfo {
    uint64_t offset;  // Offset of the first body byte
    uint32_t length;
};

class RecordReader {
public:
    static constexpr size_t DEFAULT_MAX_RECORD_SIZE = 16 * 1024 * 1024;

    explicit RecordReader(std::istream& input, size_t max_record_size = DEFAULT_MAX_RECORD_SIZE);

    // Read the next record body into memory
    std::optional<std::vector<uint8_t>> next(RecordError* error = nullptr);

    // Locate the next record body and seek past it without reading it
    std::optional<RecordInfo> skip(RecordError* error = nullptr);

    [[nodiscard]] size_t records_read() const { return records_read_; }

private:
    std::istream& input_;
    size_t max_record_size_;
    uint64_t position_{0};
    size_t records_read_{0};

    std::optional<uint32_t> read_length(RecordError& error);
};

// Append one record to a stream
bool write_record(std::ostream& out, std::span<const uint8_t> record);

}  // namespace unchunk::io
