#include "unchunk/chunk/header.hpp"

namespace unchunk {

namespace {

// Read uint32_t from bytes (big-endian)
uint32_t read_u32(std::span<const uint8_t> data) {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

// Write uint32_t to bytes (big-endian)
void write_u32(uint8_t* out, uint32_t value) {
    for (int i = 3; i >= 0; --i) {
        out[i] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
}

}  // namespace

std::array<uint8_t, ChunkHeader::SIZE> serialize_header(const ChunkHeader& header) {
    std::array<uint8_t, ChunkHeader::SIZE> data{};
    data[0] = header.end_of_message ? OPTION_END_OF_MESSAGE : 0;
    write_u32(data.data() + 1, header.id);
    write_u32(data.data() + 5, header.serial);
    return data;
}

std::optional<ChunkHeader> parse_header(std::span<const uint8_t> data) {
    if (data.size() < ChunkHeader::SIZE) {
        return std::nullopt;
    }

    ChunkHeader header;
    header.end_of_message = (data[0] & OPTION_END_OF_MESSAGE) != 0;
    header.id = read_u32(data.subspan(1, 4));
    header.serial = read_u32(data.subspan(5, 4));
    return header;
}

std::vector<uint8_t> encode_chunk(uint32_t id,
                                  uint32_t serial,
                                  bool end_of_message,
                                  std::span<const uint8_t> payload) {
    ChunkHeader header;
    header.id = id;
    header.serial = serial;
    header.end_of_message = end_of_message;

    auto header_bytes = serialize_header(header);

    std::vector<uint8_t> out;
    out.reserve(ChunkHeader::SIZE + payload.size());
    out.insert(out.end(), header_bytes.begin(), header_bytes.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

}  // namespace unchunk
