#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <unicode/ucnv.h>

namespace transcode::detail {

enum class EncodingFamily : uint8_t {
    utf8,
    utf16,
    utf32,
    single_byte,
    multi_byte,
};

enum class ByteOrder : uint8_t {
    none,    // not applicable, or BOM-sensing ("utf-16", "utf-32")
    little,
    big,
};

struct EncodingInfo {
    std::string name;       // canonical, lowercase
    std::string icu_name;   // name handed to ucnv_open
    EncodingFamily family = EncodingFamily::utf8;
    ByteOrder byte_order = ByteOrder::none;
    // Longest byte sequence of one character. Carried decode bytes are
    // always fewer than this.
    std::size_t max_sequence_length = 1;

    bool unicode() const {
        return family == EncodingFamily::utf8 || family == EncodingFamily::utf16 ||
               family == EncodingFamily::utf32;
    }
    // "utf-16"/"utf-32": byte order comes from the BOM.
    bool bom_sensing() const {
        return (family == EncodingFamily::utf16 || family == EncodingFamily::utf32) &&
               byte_order == ByteOrder::none;
    }
    bool ascii_compatible() const {
        return family == EncodingFamily::utf8 || family == EncodingFamily::single_byte ||
               family == EncodingFamily::multi_byte;
    }
};

// Resolve a label to a chunkable encoding. Throws LookupError.
EncodingInfo resolve_encoding(std::string_view label);

// The explicit-byte-order variant of a UTF-16/32 encoding.
EncodingInfo with_byte_order(const EncodingInfo& info, ByteOrder order);

struct ConverterDeleter {
    void operator()(UConverter* converter) const;
};
using ConverterPtr = std::unique_ptr<UConverter, ConverterDeleter>;

// Open a fresh ICU converter. Throws LookupError.
ConverterPtr open_converter(const std::string& icu_name);

} // namespace transcode::detail
