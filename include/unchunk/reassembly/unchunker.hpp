#pragma once

#include <any>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <vector>

#include "chunk_collector.hpp"
#include "unchunk/chunk/chunk.hpp"
#include "unchunk/chunk/error.hpp"

namespace unchunk::reassembly {

// Unchunker configuration
struct UnchunkerConfig {
    // Millisecond clock used for collector ages, monotonic time if empty
    std::function<uint64_t()> clock;
};

// Unchunker statistics
struct UnchunkerStats {
    uint64_t chunks_received{0};       // Chunks parsed successfully
    uint64_t duplicates_ignored{0};    // Chunks whose serial was already held
    uint64_t messages_delivered{0};    // Messages handed to the handler
    uint64_t messages_dropped{0};      // Complete messages with no handler set
    uint64_t merge_failures{0};        // Messages discarded with CHUNK_TOO_LARGE
    uint64_t stale_replaced{0};        // Partial messages replaced by a single-chunk message
    uint64_t messages_expired{0};      // Partial messages removed by gc()
    uint64_t chunks_expired{0};        // Chunks removed by gc()
};

// Merges chunks into messages.
//
// One instance tracks any number of message ids. Chunks may arrive in any
// order and repeated serials are ignored. Complete messages are passed to the
// message handler synchronously from the add() call that completed them.
//
// Incomplete messages are kept until they complete or gc() removes them.
// There is no internal timer: the owner must call gc() regularly, otherwise
// memory grows with every message that never completes.
//
// Not thread-safe. Callers sharing an instance must serialize access.
template <typename Payload>
class BasicUnchunker {
public:
    using MessageHandler = std::function<void(Payload message, std::vector<std::any> context)>;

    explicit BasicUnchunker(UnchunkerConfig config = {});

    // Disable copy
    BasicUnchunker(const BasicUnchunker&) = delete;
    BasicUnchunker& operator=(const BasicUnchunker&) = delete;

    // Set or replace the message handler; an empty handler drops messages
    void set_message_handler(MessageHandler handler);

    // Add a raw chunk (9 byte header + payload) with optional context.
    // Parse errors and CHUNK_TOO_LARGE are returned; duplicates return SUCCESS.
    ChunkError add(const RawInput& raw, std::any context = {});

    // Remove incomplete messages that have not been updated for more than
    // max_age_ms. Returns the number of removed chunks.
    size_t gc(uint64_t max_age_ms);

    [[nodiscard]] size_t pending_messages() const { return collectors_.size(); }
    [[nodiscard]] bool has_pending(uint32_t id) const { return collectors_.count(id) > 0; }
    [[nodiscard]] const UnchunkerStats& stats() const { return stats_; }

    // Drop all incomplete messages and statistics
    void reset();

private:
    UnchunkerConfig config_;
    std::map<uint32_t, ChunkCollector<Payload>> collectors_;
    MessageHandler handler_;
    UnchunkerStats stats_{};

    uint64_t now_ms() const;
    void notify(Payload message, std::vector<std::any> context);
};

extern template class BasicUnchunker<Bytes>;
extern template class BasicUnchunker<Blob>;

// Delivers messages as one contiguous buffer
using BytesUnchunker = BasicUnchunker<Bytes>;

// Delivers messages as blobs made of the chunk payloads, without copying them together
using BlobUnchunker = BasicUnchunker<Blob>;

}  // namespace unchunk::reassembly
