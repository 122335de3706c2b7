#pragma once

#include <system_error>
#include <type_traits>

namespace unchunk {

// Result of chunk parsing and message reassembly
enum class ChunkError {
    SUCCESS = 0,
    CHUNK_TOO_SHORT,         // Raw input shorter than the chunk header
    UNSUPPORTED_INPUT_KIND,  // Raw input is not one of the accepted kinds
    CHUNK_TOO_LARGE,         // A chunk payload exceeds the first chunk's payload
    NOT_COMPLETE,            // Merge requested before all chunks arrived
    BLOB_READ_FAILED         // Header bytes could not be read out of a blob
};

// Convert error to a human-readable string
const char* chunk_error_to_string(ChunkError error);

// Error category for std::error_code interop
const std::error_category& chunk_error_category();

std::error_code make_error_code(ChunkError error);

}  // namespace unchunk

namespace std {
template <>
struct is_error_code_enum<unchunk::ChunkError> : true_type {};
}  // namespace std
