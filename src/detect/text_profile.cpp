#include "text_profile.h"

#include <unicode/uchar.h>
#include <unicode/uscript.h>
#include <unicode/utf8.h>

#include <algorithm>

namespace transcode::detail {

namespace {

bool script_matches(UScriptCode code, Script expected) {
    switch (expected) {
    case Script::any:      return true;
    case Script::latin:    return code == USCRIPT_LATIN;
    case Script::cyrillic: return code == USCRIPT_CYRILLIC;
    case Script::greek:    return code == USCRIPT_GREEK;
    case Script::hebrew:   return code == USCRIPT_HEBREW;
    case Script::arabic:   return code == USCRIPT_ARABIC;
    case Script::japanese:
        return code == USCRIPT_HAN || code == USCRIPT_HIRAGANA || code == USCRIPT_KATAKANA;
    case Script::chinese:  return code == USCRIPT_HAN;
    case Script::korean:   return code == USCRIPT_HANGUL || code == USCRIPT_HAN;
    }
    return false;
}

bool is_neutral(UChar32 cp) {
    switch (u_charType(cp)) {
    case U_SPACE_SEPARATOR:
    case U_DASH_PUNCTUATION:
    case U_START_PUNCTUATION:
    case U_END_PUNCTUATION:
    case U_CONNECTOR_PUNCTUATION:
    case U_OTHER_PUNCTUATION:
    case U_INITIAL_PUNCTUATION:
    case U_FINAL_PUNCTUATION:
    case U_MATH_SYMBOL:
    case U_CURRENCY_SYMBOL:
    case U_MODIFIER_SYMBOL:
    case U_OTHER_SYMBOL:
    case U_DECIMAL_DIGIT_NUMBER:
    case U_OTHER_NUMBER:
    case U_NON_SPACING_MARK:
    case U_COMBINING_SPACING_MARK:
    case U_FORMAT_CHAR:
        return true;
    default:
        return false;
    }
}

bool is_turkish_marker(UChar32 cp) {
    return cp == 0x011F || cp == 0x011E || cp == 0x0131 || cp == 0x0130 || cp == 0x015F ||
           cp == 0x015E;
}

struct ScriptName {
    std::string_view encoding;
    Script script;
};

constexpr ScriptName scripts[] = {
    {"iso-8859-1", Script::latin},      {"windows-1252", Script::latin},
    {"windows-1250", Script::latin},    {"windows-1254", Script::latin},
    {"macintosh", Script::latin},       {"iso-8859-2", Script::latin},
    {"iso-8859-15", Script::latin},     {"windows-1251", Script::cyrillic},
    {"koi8-r", Script::cyrillic},       {"koi8-u", Script::cyrillic},
    {"x-mac-cyrillic", Script::cyrillic}, {"iso-8859-5", Script::cyrillic},
    {"windows-1253", Script::greek},    {"iso-8859-7", Script::greek},
    {"windows-1255", Script::hebrew},   {"iso-8859-8", Script::hebrew},
    {"windows-1256", Script::arabic},   {"iso-8859-6", Script::arabic},
    {"shift_jis", Script::japanese},    {"euc-jp", Script::japanese},
    {"gbk", Script::chinese},           {"gb2312", Script::chinese},
    {"gb18030", Script::chinese},       {"big5", Script::chinese},
    {"euc-kr", Script::korean},         {"windows-949", Script::korean},
};

} // namespace

Script expected_script(std::string_view canonical_encoding) {
    for (const auto& entry : scripts) {
        if (entry.encoding == canonical_encoding) return entry.script;
    }
    return Script::any;
}

void TextProfile::add(std::string_view utf8, Script expected) {
    const auto* s = reinterpret_cast<const uint8_t*>(utf8.data());
    const auto length = static_cast<int32_t>(utf8.size());
    bool after_ascii_letter = false;

    int32_t i = 0;
    while (i < length) {
        UChar32 cp;
        U8_NEXT(s, i, length, cp);
        if (cp < 0x80) {
            after_ascii_letter = cp >= 0 && ((cp | 0x20) >= 'a' && (cp | 0x20) <= 'z');
            if (after_ascii_letter) ++ascii_letters;
            continue;
        }

        ++non_ascii;
        bool letter = u_isalpha(cp);
        if (letter) {
            ++letters;
            UErrorCode err = U_ZERO_ERROR;
            UScriptCode code = uscript_getScript(cp, &err);
            if (U_SUCCESS(err)) {
                if (script_matches(code, expected)) ++matching_letters;
                if (code != USCRIPT_LATIN && after_ascii_letter) ++mixed;
                if (code == USCRIPT_HIRAGANA || code == USCRIPT_KATAKANA) ++kana;
                if (code == USCRIPT_HANGUL) ++hangul;
            }
            if (is_turkish_marker(cp)) ++turkish;
        } else if (is_neutral(cp)) {
            ++neutral;
        }
        after_ascii_letter = false;
    }
}

double TextProfile::plausibility(Script expected) const {
    if (non_ascii == 0) return 1.0;

    double good = static_cast<double>(matching_letters) + 0.5 * static_cast<double>(neutral);
    good -= static_cast<double>(mixed);
    double score = std::clamp(good / static_cast<double>(non_ascii), 0.0, 1.0);

    // Latin-script languages use accented letters sparingly; words made
    // mostly of them point at a wrong single-byte table.
    if (expected == Script::latin && letters > ascii_letters) {
        score *= 0.5;
    }
    return score;
}

} // namespace transcode::detail
