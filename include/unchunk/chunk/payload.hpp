#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "blob.hpp"

namespace unchunk {

// Contiguous in-memory payload
using Bytes = std::vector<uint8_t>;

// Non-owning view of caller-supplied bytes
using ByteView = std::span<const uint8_t>;

// Payload capability, specialized per representation:
//   size(p)              payload length in bytes
//   adopt(ByteView)      take a payload from in-memory input (always copies)
//   adopt(const Blob&)   take a payload from streaming input (nullopt on read failure)
//   concat(pieces, n)    join pieces in order into one payload of n bytes
template <typename Payload>
struct PayloadTraits;

template <>
struct PayloadTraits<Bytes> {
    static size_t size(const Bytes& payload) { return payload.size(); }

    static Bytes adopt(ByteView raw) {
        return Bytes(raw.begin(), raw.end());
    }

    // Streaming input has to be read out completely for this representation
    static std::optional<Bytes> adopt(const Blob& raw) {
        return raw.read_all();
    }

    static Bytes concat(std::span<const Bytes* const> pieces, size_t total_size) {
        Bytes result;
        result.reserve(total_size);
        for (const Bytes* piece : pieces) {
            result.insert(result.end(), piece->begin(), piece->end());
        }
        return result;
    }
};

template <>
struct PayloadTraits<Blob> {
    static size_t size(const Blob& payload) { return payload.size(); }

    static Blob adopt(ByteView raw) {
        return Blob::from_bytes(raw);
    }

    static std::optional<Blob> adopt(const Blob& raw) {
        return raw;
    }

    static Blob concat(std::span<const Blob* const> pieces, size_t /*total_size*/) {
        return Blob::concat(pieces);
    }
};

}  // namespace unchunk
