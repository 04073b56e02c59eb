#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace transcode::detail {

// Writing system an encoding is normally used for.
enum class Script : uint8_t {
    any,
    latin,
    cyrillic,
    greek,
    hebrew,
    arabic,
    japanese,
    chinese,
    korean,
};

Script expected_script(std::string_view canonical_encoding);

// Character-class statistics of decoded text, used to judge whether a
// decoding looks like real text in the encoding's script.
struct TextProfile {
    std::size_t ascii_letters = 0;
    std::size_t non_ascii = 0;         // non-ASCII code points, U+FFFD included
    std::size_t letters = 0;           // non-ASCII letters
    std::size_t matching_letters = 0;  // non-ASCII letters in the expected script
    std::size_t neutral = 0;           // punctuation, symbols, spaces, marks, digits
    std::size_t mixed = 0;             // non-Latin letter right after an ASCII letter
    std::size_t kana = 0;
    std::size_t hangul = 0;
    std::size_t turkish = 0;           // ğ Ğ ı İ ş Ş

    void add(std::string_view utf8, Script expected);

    // [0, 1]: share of non-ASCII characters that read as text.
    double plausibility(Script expected) const;
};

} // namespace transcode::detail
