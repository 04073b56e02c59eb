#pragma once

#include "../codec/codec.h"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace transcode::detail {

class StreamEncoder {
public:
    explicit StreamEncoder(std::unique_ptr<Encoder> encoder);

    // Encode one chunk of UTF-8 text. Characters the target cannot
    // represent are substituted and counted.
    std::string encode_chunk(std::string_view text, bool is_last);

    std::size_t replacements() const { return replacements_; }
    const EncodingInfo& encoding() const { return encoder_->encoding(); }

private:
    std::unique_ptr<Encoder> encoder_;
    std::size_t replacements_ = 0;
};

} // namespace transcode::detail
