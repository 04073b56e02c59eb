#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace transcode {

enum class NewlineStyle : uint8_t {
    lf,
    crlf,
    cr,
};

// "LF", "CRLF" or "CR", case-insensitive. Throws ValueError otherwise.
NewlineStyle parse_newline_style(std::string_view text);
std::string_view to_string(NewlineStyle style);
std::string_view terminator(NewlineStyle style);

struct DetectionResult {
    std::string encoding;      // canonical name, e.g. "utf-8"
    float confidence = 0.0f;   // [0, 1]
    bool bom_present = false;
};

struct AnalysisResult {
    DetectionResult detection;
    NewlineStyle newlines = NewlineStyle::lf;
    bool mixed_newlines = false;
};

// Canonical lowercase name for an encoding label ("UTF_8" -> "utf-8",
// "cp1252" -> "windows-1252"). Throws LookupError for unknown or
// unsupported encodings.
std::string canonical_encoding_name(std::string_view name);

} // namespace transcode
