#include "stream_decoder.h"

#include <transcode/error.h>

#include <utility>

namespace transcode::detail {

StreamDecoder::StreamDecoder(std::unique_ptr<Decoder> decoder)
    : decoder_(std::move(decoder))
{
}

std::string StreamDecoder::decode_chunk(std::string_view raw, ChunkState& state, bool is_last) {
    std::string_view input = raw;
    if (!state.pending_decode_bytes.empty()) {
        input_.assign(state.pending_decode_bytes);
        input_.append(raw);
        input = input_;
    }

    std::string text;
    text.reserve(input.size());
    DecodeResult result = decoder_->decode(input, is_last, text);
    replacements_ += result.replacements;

    state.pending_decode_bytes.assign(input.substr(result.consumed));
    if (state.pending_decode_bytes.size() >= encoding().max_sequence_length) {
        throw ConversionError("decoder for " + encoding().name + " left " +
                              std::to_string(state.pending_decode_bytes.size()) +
                              " bytes undecoded");
    }
    return text;
}

} // namespace transcode::detail
