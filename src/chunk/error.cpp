#include "unchunk/chunk/error.hpp"

#include <string>

namespace unchunk {

namespace {

class ChunkErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "unchunk";
    }

    std::string message(int value) const override {
        return chunk_error_to_string(static_cast<ChunkError>(value));
    }
};

}  // namespace

const char* chunk_error_to_string(ChunkError error) {
    switch (error) {
        case ChunkError::SUCCESS: return "success";
        case ChunkError::CHUNK_TOO_SHORT: return "invalid chunk: too short";
        case ChunkError::UNSUPPORTED_INPUT_KIND: return "unsupported chunk input kind";
        case ChunkError::CHUNK_TOO_LARGE:
            return "no chunk may be larger than the first chunk of that message";
        case ChunkError::NOT_COMPLETE: return "not all chunks for this message have arrived yet";
        case ChunkError::BLOB_READ_FAILED: return "unable to read header from blob";
    }
    return "unknown error";
}

const std::error_category& chunk_error_category() {
    static const ChunkErrorCategory category;
    return category;
}

std::error_code make_error_code(ChunkError error) {
    return {static_cast<int>(error), chunk_error_category()};
}

}  // namespace unchunk
