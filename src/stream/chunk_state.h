#pragma once

#include <string>

namespace transcode::detail {

// Carry between consecutive chunks of one stream. Never shared.
struct ChunkState {
    // Start of a multi-byte sequence still waiting for its remaining bytes.
    // Always shorter than the source encoding's longest sequence.
    std::string pending_decode_bytes;
    // The previous chunk ended in '\r' whose CRLF/CR meaning is unknown yet.
    bool pending_cr = false;
};

} // namespace transcode::detail
