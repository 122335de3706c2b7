#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace unchunk {

// Chunk option bits
inline constexpr uint8_t OPTION_END_OF_MESSAGE = 0x01;

// Chunk header (wire format, big-endian)
struct ChunkHeader {
    static constexpr size_t SIZE = 9;  // options(1) + id(4) + serial(4)
    uint32_t id{0};
    uint32_t serial{0};
    bool end_of_message{false};
};

// Serialize chunk header, reserved option bits are always zero
std::array<uint8_t, ChunkHeader::SIZE> serialize_header(const ChunkHeader& header);

// Parse chunk header, reserved option bits are ignored
std::optional<ChunkHeader> parse_header(std::span<const uint8_t> data);

// Build a complete chunk: header followed by payload
std::vector<uint8_t> encode_chunk(uint32_t id,
                                  uint32_t serial,
                                  bool end_of_message,
                                  std::span<const uint8_t> payload);

}  // namespace unchunk
