#include "unchunk/reassembly/chunk_collector.hpp"

#include <utility>

namespace unchunk::reassembly {

template <typename Payload>
ChunkCollector<Payload>::ChunkCollector(uint64_t now_ms)
    : last_update_ms_(now_ms) {
}

template <typename Payload>
bool ChunkCollector<Payload>::add_chunk(Chunk chunk, uint64_t now_ms) {
    const uint32_t serial = chunk.serial();
    if (has_serial(serial)) {
        return false;
    }

    const bool end_of_message = chunk.is_end_of_message();
    chunks_.emplace(serial, std::move(chunk));

    last_update_ms_ = now_ms;
    if (end_of_message) {
        end_arrived_ = true;
        expected_count_ = static_cast<uint64_t>(serial) + 1;
    }
    return true;
}

template <typename Payload>
bool ChunkCollector<Payload>::is_complete() const {
    if (!end_arrived_ || !expected_count_ || chunks_.size() != *expected_count_) {
        return false;
    }

    // Serials are unique, so count plus highest serial proves 0..end is covered
    return chunks_.rbegin()->first < *expected_count_;
}

template <typename Payload>
std::optional<MergedMessage<Payload>> ChunkCollector<Payload>::merge(ChunkError* error) const {
    auto set_error = [error](ChunkError e) {
        if (error) *error = e;
    };

    if (!is_complete()) {
        set_error(ChunkError::NOT_COMPLETE);
        return std::nullopt;
    }

    // Map iteration is already ascending by serial
    const size_t unit = chunks_.begin()->second.payload_size();
    size_t total_size = 0;

    std::vector<const Payload*> pieces;
    pieces.reserve(chunks_.size());

    MergedMessage<Payload> merged;
    for (const auto& [serial, chunk] : chunks_) {
        if (chunk.payload_size() > unit) {
            set_error(ChunkError::CHUNK_TOO_LARGE);
            return std::nullopt;
        }
        pieces.push_back(&chunk.payload());
        total_size += chunk.payload_size();

        if (chunk.has_context()) {
            merged.context.push_back(chunk.context());
        }
    }

    merged.message = PayloadTraits<Payload>::concat(pieces, total_size);

    set_error(ChunkError::SUCCESS);
    return merged;
}

template <typename Payload>
bool ChunkCollector<Payload>::is_older_than(uint64_t max_age_ms, uint64_t now_ms) const {
    // Clock going backwards counts as age zero
    if (now_ms < last_update_ms_) {
        return false;
    }
    return now_ms - last_update_ms_ > max_age_ms;
}

template class ChunkCollector<Bytes>;
template class ChunkCollector<Blob>;

}  // namespace unchunk::reassembly
