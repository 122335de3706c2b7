#include "unchunk/chunk/chunk.hpp"

#include <array>
#include <type_traits>

namespace unchunk {

namespace {

template <typename Payload>
std::optional<BasicChunk<Payload>> chunk_from_bytes(ByteView raw,
                                                    std::any& context,
                                                    ChunkError& error) {
    auto header = parse_header(raw);
    if (!header) {
        error = ChunkError::CHUNK_TOO_SHORT;
        return std::nullopt;
    }

    // Copy, so later changes to the caller's buffer cannot leak into queued chunks
    return BasicChunk<Payload>(*header,
                               PayloadTraits<Payload>::adopt(raw.subspan(ChunkHeader::SIZE)),
                               std::move(context));
}

template <typename Payload>
std::optional<BasicChunk<Payload>> chunk_from_blob(const Blob& raw,
                                                   std::any& context,
                                                   ChunkError& error) {
    // Size is known up front, only the header has to be read out
    if (raw.size() < ChunkHeader::SIZE) {
        error = ChunkError::CHUNK_TOO_SHORT;
        return std::nullopt;
    }

    std::array<uint8_t, ChunkHeader::SIZE> header_bytes{};
    if (!raw.read(0, header_bytes)) {
        error = ChunkError::BLOB_READ_FAILED;
        return std::nullopt;
    }

    auto header = parse_header(header_bytes);
    if (!header) {
        error = ChunkError::CHUNK_TOO_SHORT;
        return std::nullopt;
    }

    auto payload = PayloadTraits<Payload>::adopt(raw.slice(ChunkHeader::SIZE, raw.size()));
    if (!payload) {
        error = ChunkError::BLOB_READ_FAILED;
        return std::nullopt;
    }

    return BasicChunk<Payload>(*header, std::move(*payload), std::move(context));
}

}  // namespace

template <typename Payload>
std::optional<BasicChunk<Payload>> create_chunk(const RawInput& raw,
                                                std::any context,
                                                ChunkError* error) {
    ChunkError result = ChunkError::SUCCESS;

    auto chunk = std::visit([&](const auto& input) -> std::optional<BasicChunk<Payload>> {
        using T = std::decay_t<decltype(input)>;
        if constexpr (std::is_same_v<T, ByteView>) {
            return chunk_from_bytes<Payload>(input, context, result);
        } else if constexpr (std::is_same_v<T, Blob>) {
            return chunk_from_blob<Payload>(input, context, result);
        } else {
            static_assert(std::is_same_v<T, std::monostate>, "unhandled raw input kind");
            result = ChunkError::UNSUPPORTED_INPUT_KIND;
            return std::nullopt;
        }
    }, raw);

    if (error) *error = result;
    return chunk;
}

template std::optional<BasicChunk<Bytes>> create_chunk<Bytes>(
    const RawInput&, std::any, ChunkError*);
template std::optional<BasicChunk<Blob>> create_chunk<Blob>(
    const RawInput&, std::any, ChunkError*);

}  // namespace unchunk
