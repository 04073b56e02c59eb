#pragma once

#include "../codec/codec.h"
#include "chunk_state.h"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace transcode::detail {

class StreamDecoder {
public:
    explicit StreamDecoder(std::unique_ptr<Decoder> decoder);

    // Decode one raw chunk to UTF-8, carrying an incomplete trailing
    // sequence in `state`. With is_last the carry is flushed and any
    // leftover bytes become U+FFFD.
    std::string decode_chunk(std::string_view raw, ChunkState& state, bool is_last);

    std::size_t replacements() const { return replacements_; }
    const EncodingInfo& encoding() const { return decoder_->encoding(); }

private:
    std::unique_ptr<Decoder> decoder_;
    std::string input_;
    std::size_t replacements_ = 0;
};

} // namespace transcode::detail
