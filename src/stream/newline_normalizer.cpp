#include "newline_normalizer.h"

#include <transcode/error.h>

#include <cctype>
#include <string>

namespace transcode {

NewlineStyle parse_newline_style(std::string_view text) {
    std::string upper;
    for (char c : text) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (upper == "LF") return NewlineStyle::lf;
    if (upper == "CRLF") return NewlineStyle::crlf;
    if (upper == "CR") return NewlineStyle::cr;
    throw ValueError("invalid newlines value '" + std::string(text) +
                     "'; must be 'LF', 'CRLF' or 'CR'");
}

std::string_view to_string(NewlineStyle style) {
    switch (style) {
    case NewlineStyle::lf:   return "LF";
    case NewlineStyle::crlf: return "CRLF";
    case NewlineStyle::cr:   return "CR";
    }
    return "LF";
}

std::string_view terminator(NewlineStyle style) {
    switch (style) {
    case NewlineStyle::lf:   return "\n";
    case NewlineStyle::crlf: return "\r\n";
    case NewlineStyle::cr:   return "\r";
    }
    return "\n";
}

} // namespace transcode

namespace transcode::detail {

NewlineStyle NewlineCounts::dominant() const {
    if (crlf > 0) return NewlineStyle::crlf;
    if (lf > 0) return NewlineStyle::lf;
    if (cr > 0) return NewlineStyle::cr;
    return NewlineStyle::lf;
}

bool NewlineCounts::mixed() const {
    int kinds = (lf > 0) + (crlf > 0) + (cr > 0);
    return kinds > 1;
}

NewlineNormalizer::NewlineNormalizer(NewlineStyle target)
    : target_(target)
    , terminator_(terminator(target))
{
}

std::string NewlineNormalizer::normalize_chunk(std::string_view text, bool& pending_cr) {
    std::string out;
    out.reserve(text.size() + text.size() / 16);

    std::size_t i = 0;
    if (pending_cr && !text.empty()) {
        pending_cr = false;
        out += terminator_;
        if (text[0] == '\n') {
            ++counts_.crlf;
            i = 1;
        } else {
            ++counts_.cr;
        }
    }

    // Both terminator bytes are ASCII, so scanning UTF-8 bytewise is safe.
    std::size_t run_start = i;
    for (; i < text.size(); ++i) {
        char c = text[i];
        if (c != '\r' && c != '\n') continue;

        out.append(text.substr(run_start, i - run_start));
        if (c == '\n') {
            ++counts_.lf;
            out += terminator_;
        } else if (i + 1 == text.size()) {
            pending_cr = true;
        } else if (text[i + 1] == '\n') {
            ++counts_.crlf;
            out += terminator_;
            ++i;
        } else {
            ++counts_.cr;
            out += terminator_;
        }
        run_start = i + 1;
    }
    if (run_start < text.size()) {
        out.append(text.substr(run_start));
    }
    return out;
}

std::string NewlineNormalizer::flush(bool& pending_cr) {
    if (!pending_cr) return {};
    pending_cr = false;
    ++counts_.cr;
    return std::string(terminator_);
}

} // namespace transcode::detail
