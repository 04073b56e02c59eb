#pragma once

#include "encoding_registry.h"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace transcode::detail {

struct DecodeResult {
    std::size_t consumed = 0;       // input bytes converted or replaced
    std::size_t replacements = 0;   // U+FFFD substitutions in this call
    std::size_t invalid_bytes = 0;  // input bytes covered by those substitutions
};

class Decoder {
public:
    virtual ~Decoder() = default;

    // Append UTF-8 text for every complete sequence in input. A trailing
    // incomplete sequence is left unconsumed, unless is_last, in which case
    // it is replaced like any other invalid sequence.
    virtual DecodeResult decode(std::string_view input, bool is_last, std::string& out) = 0;

    virtual const EncodingInfo& encoding() const = 0;
};

class Encoder {
public:
    virtual ~Encoder() = default;

    // Append the encoded form of UTF-8 text. Returns the number of
    // characters replaced because the target cannot represent them.
    virtual std::size_t encode(std::string_view utf8, bool is_last, std::string& out) = 0;

    virtual const EncodingInfo& encoding() const = 0;
};

// Unmarked UTF-16/32 input is decoded as big-endian; strip or interpret the
// BOM before calling.
std::unique_ptr<Decoder> make_decoder(const EncodingInfo& encoding);
std::unique_ptr<Encoder> make_encoder(const EncodingInfo& encoding);

} // namespace transcode::detail
