#pragma once

#include <any>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "unchunk/chunk/chunk.hpp"
#include "unchunk/chunk/error.hpp"

namespace unchunk::reassembly {

// A reassembled message and the contexts of the chunks that carried one,
// in serial order
template <typename Payload>
struct MergedMessage {
    Payload message;
    std::vector<std::any> context;
};

// Chunks received so far for one message id
template <typename Payload>
class ChunkCollector {
public:
    using Chunk = BasicChunk<Payload>;

    explicit ChunkCollector(uint64_t now_ms);

    // Register a chunk. Returns false if a chunk with the same serial is
    // already held, in which case nothing changes.
    bool add_chunk(Chunk chunk, uint64_t now_ms);

    [[nodiscard]] bool has_serial(uint32_t serial) const { return chunks_.count(serial) > 0; }

    // End chunk seen and serials 0..end exactly present
    [[nodiscard]] bool is_complete() const;

    // Merge payloads in serial order.
    // Fails with NOT_COMPLETE before completion and with CHUNK_TOO_LARGE if
    // any payload is larger than the first one.
    std::optional<MergedMessage<Payload>> merge(ChunkError* error = nullptr) const;

    // True if no chunk was accepted during the last max_age_ms
    [[nodiscard]] bool is_older_than(uint64_t max_age_ms, uint64_t now_ms) const;

    [[nodiscard]] size_t chunk_count() const { return chunks_.size(); }
    [[nodiscard]] bool end_arrived() const { return end_arrived_; }
    [[nodiscard]] std::optional<uint64_t> expected_count() const { return expected_count_; }
    [[nodiscard]] uint64_t last_update_ms() const { return last_update_ms_; }

private:
    std::map<uint32_t, Chunk> chunks_;  // keyed by serial
    bool end_arrived_{false};
    std::optional<uint64_t> expected_count_;  // end serial + 1, wider than a serial
    uint64_t last_update_ms_;
};

extern template class ChunkCollector<Bytes>;
extern template class ChunkCollector<Blob>;

}  // namespace unchunk::reassembly
