#include "unchunk/reassembly/unchunker.hpp"

#include <spdlog/spdlog.h>

#include <utility>

#include "unchunk/utils/time.hpp"

namespace unchunk::reassembly {

template <typename Payload>
BasicUnchunker<Payload>::BasicUnchunker(UnchunkerConfig config)
    : config_(std::move(config)) {
}

template <typename Payload>
void BasicUnchunker<Payload>::set_message_handler(MessageHandler handler) {
    handler_ = std::move(handler);
}

template <typename Payload>
uint64_t BasicUnchunker<Payload>::now_ms() const {
    return config_.clock ? config_.clock() : utils::time_ms();
}

template <typename Payload>
ChunkError BasicUnchunker<Payload>::add(const RawInput& raw, std::any context) {
    ChunkError error = ChunkError::SUCCESS;
    auto chunk = create_chunk<Payload>(raw, std::move(context), &error);
    if (!chunk) {
        spdlog::debug("Rejected chunk: {}", chunk_error_to_string(error));
        return error;
    }
    ++stats_.chunks_received;

    const uint32_t id = chunk->id();
    const uint32_t serial = chunk->serial();

    auto it = collectors_.find(id);
    if (it != collectors_.end() && it->second.has_serial(serial)) {
        ++stats_.duplicates_ignored;
        spdlog::debug("Ignoring duplicate chunk (id={}, serial={})", id, serial);
        return ChunkError::SUCCESS;
    }

    // Single-chunk message, deliver without a collector
    if (serial == 0 && chunk->is_end_of_message()) {
        if (it != collectors_.end()) {
            spdlog::debug("Single-chunk message {} replaces {} pending chunks with the same id",
                          id, it->second.chunk_count());
            collectors_.erase(it);
            ++stats_.stale_replaced;
        }

        std::vector<std::any> contexts;
        if (chunk->has_context()) {
            contexts.push_back(chunk->context());
        }
        notify(std::move(*chunk).release_payload(), std::move(contexts));
        return ChunkError::SUCCESS;
    }

    const uint64_t now = now_ms();
    if (it == collectors_.end()) {
        it = collectors_.emplace(id, ChunkCollector<Payload>(now)).first;
    }
    auto& collector = it->second;

    if (auto expected = collector.expected_count(); expected && serial >= *expected) {
        spdlog::warn("Chunk serial {} beyond end of message {} ({} chunks)", serial, id, *expected);
    }

    collector.add_chunk(std::move(*chunk), now);
    if (!collector.is_complete()) {
        return ChunkError::SUCCESS;
    }

    auto merged = collector.merge(&error);

    // The entry goes away either way, a failed message cannot be recovered
    collectors_.erase(it);

    if (!merged) {
        ++stats_.merge_failures;
        spdlog::warn("Dropping message {}: {}", id, chunk_error_to_string(error));
        return error;
    }

    notify(std::move(merged->message), std::move(merged->context));
    return ChunkError::SUCCESS;
}

template <typename Payload>
void BasicUnchunker<Payload>::notify(Payload message, std::vector<std::any> context) {
    if (!handler_) {
        ++stats_.messages_dropped;
        return;
    }
    ++stats_.messages_delivered;
    handler_(std::move(message), std::move(context));
}

template <typename Payload>
size_t BasicUnchunker<Payload>::gc(uint64_t max_age_ms) {
    const uint64_t now = now_ms();
    size_t removed = 0;

    for (auto it = collectors_.begin(); it != collectors_.end(); ) {
        if (it->second.is_older_than(max_age_ms, now)) {
            removed += it->second.chunk_count();
            ++stats_.messages_expired;
            it = collectors_.erase(it);
        } else {
            ++it;
        }
    }

    stats_.chunks_expired += removed;
    if (removed > 0) {
        spdlog::debug("Garbage collection removed {} chunks, {} messages pending",
                      removed, collectors_.size());
    }
    return removed;
}

template <typename Payload>
void BasicUnchunker<Payload>::reset() {
    collectors_.clear();
    stats_ = {};
}

template class BasicUnchunker<Bytes>;
template class BasicUnchunker<Blob>;

}  // namespace unchunk::reassembly
