#include "encoding_registry.h"

#include <transcode/encoding.h>
#include <transcode/error.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

namespace transcode::detail {

namespace {

struct Alias {
    std::string_view label;      // normalized: lowercase, '-' separators
    std::string_view canonical;
};

// Python codec names and common spellings mapped to the names we report.
constexpr Alias aliases[] = {
    {"utf-8", "utf-8"},
    {"utf8", "utf-8"},
    {"utf-8-sig", "utf-8"},
    {"utf-16", "utf-16"},
    {"utf16", "utf-16"},
    {"utf-16le", "utf-16le"},
    {"utf-16-le", "utf-16le"},
    {"utf16le", "utf-16le"},
    {"utf16-le", "utf-16le"},
    {"utf-16be", "utf-16be"},
    {"utf-16-be", "utf-16be"},
    {"utf16be", "utf-16be"},
    {"utf16-be", "utf-16be"},
    {"utf-32", "utf-32"},
    {"utf32", "utf-32"},
    {"utf-32le", "utf-32le"},
    {"utf-32-le", "utf-32le"},
    {"utf32le", "utf-32le"},
    {"utf-32be", "utf-32be"},
    {"utf-32-be", "utf-32be"},
    {"utf32be", "utf-32be"},
    {"ascii", "us-ascii"},
    {"us-ascii", "us-ascii"},
    {"iso-8859-1", "iso-8859-1"},
    {"iso8859-1", "iso-8859-1"},
    {"latin-1", "iso-8859-1"},
    {"latin1", "iso-8859-1"},
    {"windows-1250", "windows-1250"},
    {"cp1250", "windows-1250"},
    {"cp-1250", "windows-1250"},
    {"windows-1251", "windows-1251"},
    {"cp1251", "windows-1251"},
    {"cp-1251", "windows-1251"},
    {"windows-1252", "windows-1252"},
    {"cp1252", "windows-1252"},
    {"cp-1252", "windows-1252"},
    {"windows-1253", "windows-1253"},
    {"cp1253", "windows-1253"},
    {"windows-1254", "windows-1254"},
    {"cp1254", "windows-1254"},
    {"windows-1255", "windows-1255"},
    {"cp1255", "windows-1255"},
    {"windows-1256", "windows-1256"},
    {"cp1256", "windows-1256"},
    {"windows-949", "windows-949"},
    {"cp949", "windows-949"},
    {"shift-jis", "shift_jis"},
    {"shift-jis-2004", "shift_jis"},
    {"sjis", "shift_jis"},
    {"cp932", "shift_jis"},
    {"euc-jp", "euc-jp"},
    {"eucjp", "euc-jp"},
    {"euc-kr", "euc-kr"},
    {"euckr", "euc-kr"},
    {"gb2312", "gb2312"},
    {"gbk", "gbk"},
    {"big5", "big5"},
    {"macintosh", "macintosh"},
    {"mac-roman", "macintosh"},
    {"mac-cyrillic", "x-mac-cyrillic"},
    {"x-mac-cyrillic", "x-mac-cyrillic"},
    {"koi8r", "koi8-r"},
    {"koi8-r", "koi8-r"},
    {"koi8u", "koi8-u"},
    {"koi8-u", "koi8-u"},
};

std::string normalize_label(std::string_view label) {
    std::string out;
    out.reserve(label.size());
    for (char c : label) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) continue;
        out += (c == '_') ? '-' : static_cast<char>(std::tolower(uc));
    }
    return out;
}

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Name we report for an encoding ICU knows but our alias table does not.
std::string standard_name(const std::string& label, UConverter* converter) {
    for (const char* standard : {"MIME", "IANA"}) {
        UErrorCode err = U_ZERO_ERROR;
        const char* name = ucnv_getStandardName(label.c_str(), standard, &err);
        if (U_SUCCESS(err) && name) return lowercase(name);
    }
    UErrorCode err = U_ZERO_ERROR;
    const char* name = ucnv_getName(converter, &err);
    return lowercase(U_SUCCESS(err) && name ? name : label.c_str());
}

void classify(EncodingInfo& info, UConverter* converter) {
    switch (ucnv_getType(converter)) {
    case UCNV_UTF8:
        info.family = EncodingFamily::utf8;
        info.max_sequence_length = 4;
        break;
    case UCNV_UTF16:
        info.family = EncodingFamily::utf16;
        info.max_sequence_length = 4;
        break;
    case UCNV_UTF16_LittleEndian:
        info.family = EncodingFamily::utf16;
        info.byte_order = ByteOrder::little;
        info.max_sequence_length = 4;
        break;
    case UCNV_UTF16_BigEndian:
        info.family = EncodingFamily::utf16;
        info.byte_order = ByteOrder::big;
        info.max_sequence_length = 4;
        break;
    case UCNV_UTF32:
        info.family = EncodingFamily::utf32;
        info.max_sequence_length = 4;
        break;
    case UCNV_UTF32_LittleEndian:
        info.family = EncodingFamily::utf32;
        info.byte_order = ByteOrder::little;
        info.max_sequence_length = 4;
        break;
    case UCNV_UTF32_BigEndian:
        info.family = EncodingFamily::utf32;
        info.byte_order = ByteOrder::big;
        info.max_sequence_length = 4;
        break;
    case UCNV_SBCS:
    case UCNV_LATIN_1:
    case UCNV_US_ASCII:
        info.family = EncodingFamily::single_byte;
        info.max_sequence_length = 1;
        break;
    case UCNV_DBCS:
    case UCNV_MBCS: {
        auto max_char = static_cast<std::size_t>(ucnv_getMaxCharSize(converter));
        if (max_char <= 1) {
            info.family = EncodingFamily::single_byte;
            info.max_sequence_length = 1;
        } else {
            info.family = EncodingFamily::multi_byte;
            info.max_sequence_length = std::max<std::size_t>(max_char, 2);
        }
        break;
    }
    default:
        // Shift-state encodings (ISO-2022, UTF-7, HZ, ...) keep state that
        // cannot be expressed as a byte carry between chunks.
        throw LookupError("unsupported stateful encoding: " + info.name);
    }
}

} // namespace

void ConverterDeleter::operator()(UConverter* converter) const {
    ucnv_close(converter);
}

ConverterPtr open_converter(const std::string& icu_name) {
    UErrorCode err = U_ZERO_ERROR;
    ConverterPtr converter(ucnv_open(icu_name.c_str(), &err));
    if (U_FAILURE(err) || !converter) {
        throw LookupError("unknown encoding: " + icu_name);
    }
    return converter;
}

EncodingInfo resolve_encoding(std::string_view label) {
    std::string key = normalize_label(label);
    if (key.empty()) {
        throw LookupError("empty encoding name");
    }

    EncodingInfo info;
    auto it = std::find_if(std::begin(aliases), std::end(aliases),
                           [&](const Alias& a) { return a.label == key; });
    if (it != std::end(aliases)) {
        info.name = std::string(it->canonical);
        info.icu_name = info.name;
    } else {
        info.icu_name = std::string(label);
    }

    ConverterPtr converter = open_converter(info.icu_name);
    if (info.name.empty()) {
        info.name = standard_name(info.icu_name, converter.get());
    }
    classify(info, converter.get());
    return info;
}

EncodingInfo with_byte_order(const EncodingInfo& info, ByteOrder order) {
    if (!info.bom_sensing() || order == ByteOrder::none) {
        return info;
    }
    const bool little = order == ByteOrder::little;
    if (info.family == EncodingFamily::utf16) {
        return resolve_encoding(little ? "utf-16le" : "utf-16be");
    }
    return resolve_encoding(little ? "utf-32le" : "utf-32be");
}

} // namespace transcode::detail

namespace transcode {

std::string canonical_encoding_name(std::string_view name) {
    return detail::resolve_encoding(name).name;
}

} // namespace transcode
