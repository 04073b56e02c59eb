#include "stream_encoder.h"

#include <utility>

namespace transcode::detail {

StreamEncoder::StreamEncoder(std::unique_ptr<Encoder> encoder)
    : encoder_(std::move(encoder))
{
}

std::string StreamEncoder::encode_chunk(std::string_view text, bool is_last) {
    std::string bytes;
    bytes.reserve(text.size());
    replacements_ += encoder_->encode(text, is_last, bytes);
    return bytes;
}

} // namespace transcode::detail
