#pragma once

#include <any>
#include <cstdint>
#include <optional>
#include <utility>
#include <variant>

#include "blob.hpp"
#include "error.hpp"
#include "header.hpp"
#include "payload.hpp"

namespace unchunk {

// Accepted raw chunk inputs. std::monostate stands for "no input" and is rejected.
using RawInput = std::variant<std::monostate, ByteView, Blob>;

// Parsed view of one received chunk: header fields, payload without header
// and an optional caller-supplied context (empty std::any when absent)
template <typename Payload>
class BasicChunk {
public:
    BasicChunk(const ChunkHeader& header, Payload payload, std::any context)
        : header_(header), payload_(std::move(payload)), context_(std::move(context)) {}

    [[nodiscard]] uint32_t id() const { return header_.id; }
    [[nodiscard]] uint32_t serial() const { return header_.serial; }
    [[nodiscard]] bool is_end_of_message() const { return header_.end_of_message; }
    [[nodiscard]] const ChunkHeader& header() const { return header_; }

    [[nodiscard]] const Payload& payload() const { return payload_; }
    [[nodiscard]] size_t payload_size() const { return PayloadTraits<Payload>::size(payload_); }

    // Move the payload out of a chunk that is about to be discarded
    [[nodiscard]] Payload release_payload() && { return std::move(payload_); }

    [[nodiscard]] const std::any& context() const { return context_; }
    [[nodiscard]] bool has_context() const { return context_.has_value(); }

private:
    ChunkHeader header_;
    Payload payload_;
    std::any context_;
};

using BytesChunk = BasicChunk<Bytes>;
using BlobChunk = BasicChunk<Blob>;

// Parse a raw chunk.
// In-memory input is copied, blob input is referenced lazily after its
// header bytes have been read out. Returns nullopt on failure and sets *error.
template <typename Payload>
std::optional<BasicChunk<Payload>> create_chunk(const RawInput& raw,
                                                std::any context = {},
                                                ChunkError* error = nullptr);

extern template std::optional<BasicChunk<Bytes>> create_chunk<Bytes>(
    const RawInput&, std::any, ChunkError*);
extern template std::optional<BasicChunk<Blob>> create_chunk<Blob>(
    const RawInput&, std::any, ChunkError*);

}  // namespace unchunk
