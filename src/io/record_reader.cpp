#include "unchunk/io/record_reader.hpp"

#include <array>
#include <istream>
#include <limits>
#include <ostream>

namespace unchunk::io {

const char* record_error_to_string(RecordError error) {
    switch (error) {
        case RecordError::SUCCESS: return "success";
        case RecordError::END_OF_STREAM: return "end of stream";
        case RecordError::TRUNCATED_LENGTH: return "truncated length prefix";
        case RecordError::TRUNCATED_RECORD: return "truncated record";
        case RecordError::RECORD_TOO_LARGE: return "record too large";
    }
    return "unknown error";
}

RecordReader::RecordReader(std::istream& input, size_t max_record_size)
    : input_(input), max_record_size_(max_record_size) {
}

std::optional<uint32_t> RecordReader::read_length(RecordError& error) {
    std::array<uint8_t, 4> prefix{};
    input_.read(reinterpret_cast<char*>(prefix.data()), prefix.size());
    auto got = static_cast<size_t>(input_.gcount());

    if (got == 0) {
        error = RecordError::END_OF_STREAM;
        return std::nullopt;
    }
    if (got < prefix.size()) {
        error = RecordError::TRUNCATED_LENGTH;
        return std::nullopt;
    }
    position_ += prefix.size();

    uint32_t length = 0;
    for (uint8_t b : prefix) {
        length = (length << 8) | b;
    }

    if (length > max_record_size_) {
        error = RecordError::RECORD_TOO_LARGE;
        return std::nullopt;
    }
    return length;
}

std::optional<std::vector<uint8_t>> RecordReader::next(RecordError* error) {
    RecordError result = RecordError::SUCCESS;
    auto length = read_length(result);
    if (!length) {
        if (error) *error = result;
        return std::nullopt;
    }

    std::vector<uint8_t> record(*length);
    input_.read(reinterpret_cast<char*>(record.data()), static_cast<std::streamsize>(*length));
    if (static_cast<size_t>(input_.gcount()) != *length) {
        if (error) *error = RecordError::TRUNCATED_RECORD;
        return std::nullopt;
    }

    position_ += *length;
    ++records_read_;
    if (error) *error = RecordError::SUCCESS;
    return record;
}

std::optional<RecordInfo> RecordReader::skip(RecordError* error) {
    RecordError result = RecordError::SUCCESS;
    auto length = read_length(result);
    if (!length) {
        if (error) *error = result;
        return std::nullopt;
    }

    RecordInfo info{position_, *length};

    // ignore() stops at end of stream, so the count tells truncation apart
    input_.ignore(static_cast<std::streamsize>(*length));
    if (static_cast<size_t>(input_.gcount()) != *length) {
        if (error) *error = RecordError::TRUNCATED_RECORD;
        return std::nullopt;
    }

    position_ += *length;
    ++records_read_;
    if (error) *error = RecordError::SUCCESS;
    return info;
}

bool write_record(std::ostream& out, std::span<const uint8_t> record) {
    if (record.size() > std::numeric_limits<uint32_t>::max()) {
        return false;
    }

    auto length = static_cast<uint32_t>(record.size());
    std::array<uint8_t, 4> prefix = {
        static_cast<uint8_t>(length >> 24),
        static_cast<uint8_t>(length >> 16),
        static_cast<uint8_t>(length >> 8),
        static_cast<uint8_t>(length & 0xFF)
    };

    out.write(reinterpret_cast<const char*>(prefix.data()), prefix.size());
    out.write(reinterpret_cast<const char*>(record.data()),
              static_cast<std::streamsize>(record.size()));
    return static_cast<bool>(out);
}

}  // namespace unchunk::io
