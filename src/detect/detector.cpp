#include "detector.h"

#include "../codec/codec.h"

#include <spdlog/spdlog.h>

#include <unicode/ucsdet.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace transcode::detail {

namespace {

constexpr float kAsciiConfidence = 0.95f;
constexpr float kUtf8Confidence = 0.99f;
constexpr float kFallbackConfidence = 0.1f;

// score = validity - kReplacementWeight * replacement_ratio
//       + kPlausibilityWeight * (text + statistics) / 2 + marker bonus
constexpr double kReplacementWeight = 0.25;
constexpr double kPlausibilityWeight = 0.3;
constexpr double kMarkerBonus = 0.1;
constexpr double kMaxScore = 1.3;
constexpr double kTieEpsilon = 1e-6;
// ucsdet guesses from a handful of high bytes are noise.
constexpr std::size_t kStatisticalMinHighBytes = 16;

// NUL-pattern detection looks at this many leading bytes.
constexpr std::size_t kWideProbeBytes = 1000;
constexpr std::size_t kWideMinBytes = 20;

bool has_prefix(std::string_view data, std::string_view prefix) {
    return data.size() >= prefix.size() && data.substr(0, prefix.size()) == prefix;
}

bool is_high(char c) {
    return static_cast<unsigned char>(c) >= 0x80;
}

// A slice cut from the middle of a file can start inside a UTF-8 sequence.
std::string_view skip_continuation_bytes(std::string_view segment) {
    std::size_t n = 0;
    while (n < 3 && n < segment.size() && (static_cast<unsigned char>(segment[n]) & 0xC0) == 0x80) {
        ++n;
    }
    return segment.substr(n);
}

// UTF-16/32 without a BOM, recognized by where ASCII text puts its NULs.
std::optional<std::string_view> detect_wide_unicode(std::string_view head) {
    if (head.size() < kWideMinBytes) return std::nullopt;

    std::size_t n = std::min(head.size(), kWideProbeBytes) & ~std::size_t{3};
    std::size_t zeros[4] = {0, 0, 0, 0};
    for (std::size_t i = 0; i < n; ++i) {
        if (head[i] == '\0') ++zeros[i % 4];
    }

    const std::size_t quads = n / 4;
    auto mostly = [&](std::size_t count) { return count * 10 >= quads * 9; };
    auto rarely = [&](std::size_t count) { return count * 2 < quads; };
    if (mostly(zeros[2]) && mostly(zeros[3]) && rarely(zeros[0])) return "utf-32le";
    if (mostly(zeros[0]) && mostly(zeros[1]) && rarely(zeros[3])) return "utf-32be";

    const std::size_t even = zeros[0] + zeros[2];
    const std::size_t odd = zeros[1] + zeros[3];
    const std::size_t threshold = n / 16;
    if (odd > threshold && even < threshold / 2) return "utf-16le";
    if (even > threshold && odd < threshold / 2) return "utf-16be";
    return std::nullopt;
}

struct Decoded {
    std::size_t invalid_bytes = 0;
    std::size_t replacements = 0;
    TextProfile profile;
};

// With `complete`, the last segment ends the source and a sequence cut
// off there is invalid.
Decoded decode_segments(const EncodingInfo& encoding, Script script,
                        const std::vector<std::string_view>& segments, bool complete) {
    Decoded out;
    auto decoder = make_decoder(encoding);
    std::string text;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        std::string_view segment = segments[i];
        if (i > 0 && encoding.family == EncodingFamily::utf8) {
            segment = skip_continuation_bytes(segment);
        }
        text.clear();
        // Otherwise a sequence cut at the segment end stays pending instead
        // of counting as invalid, and the carry is dropped.
        const bool is_last = complete && i + 1 == segments.size();
        DecodeResult r = decoder->decode(segment, is_last, text);
        out.invalid_bytes += r.invalid_bytes;
        out.replacements += r.replacements;
        out.profile.add(text, script);
    }
    return out;
}

struct CharsetDetectorDeleter {
    void operator()(UCharsetDetector* detector) const { ucsdet_close(detector); }
};

struct StatisticalAlias {
    std::string_view icu;        // ucsdet result, lowercased
    std::string_view candidate;  // canonical candidate it vouches for
};

constexpr StatisticalAlias statistical_aliases[] = {
    {"utf-8", "utf-8"},
    {"iso-8859-1", "windows-1252"},
    {"iso-8859-1", "iso-8859-1"},
    {"windows-1252", "windows-1252"},
    {"windows-1252", "iso-8859-1"},
    {"iso-8859-2", "windows-1250"},
    {"windows-1250", "windows-1250"},
    {"windows-1251", "windows-1251"},
    {"koi8-r", "koi8-r"},
    {"iso-8859-7", "windows-1253"},
    {"windows-1253", "windows-1253"},
    {"iso-8859-8", "windows-1255"},
    {"windows-1255", "windows-1255"},
    {"iso-8859-6", "windows-1256"},
    {"windows-1256", "windows-1256"},
    {"iso-8859-9", "windows-1254"},
    {"windows-1254", "windows-1254"},
    {"shift_jis", "shift_jis"},
    {"euc-jp", "euc-jp"},
    {"euc-kr", "euc-kr"},
    {"euc-kr", "windows-949"},
    {"gb18030", "gbk"},
    {"gb18030", "gb2312"},
    {"gb18030", "gb18030"},
    {"big5", "big5"},
};

// ICU's statistical recognizers, as candidate name -> confidence in [0, 1].
std::map<std::string, double> statistical_confidence(std::string_view bytes) {
    std::map<std::string, double> out;
    UErrorCode err = U_ZERO_ERROR;
    std::unique_ptr<UCharsetDetector, CharsetDetectorDeleter> detector(ucsdet_open(&err));
    if (U_FAILURE(err) || !detector) {
        spdlog::debug("charset detector unavailable: {}", u_errorName(err));
        return out;
    }

    auto length = static_cast<int32_t>(std::min<std::size_t>(bytes.size(), INT32_MAX));
    ucsdet_setText(detector.get(), bytes.data(), length, &err);
    int32_t count = 0;
    const UCharsetMatch** matches = ucsdet_detectAll(detector.get(), &count, &err);
    if (U_FAILURE(err) || !matches) {
        spdlog::debug("charset detector found no match: {}", u_errorName(err));
        return out;
    }

    for (int32_t i = 0; i < count; ++i) {
        UErrorCode match_err = U_ZERO_ERROR;
        const char* name = ucsdet_getName(matches[i], &match_err);
        int32_t confidence = ucsdet_getConfidence(matches[i], &match_err);
        if (U_FAILURE(match_err) || !name) continue;

        std::string icu(name);
        std::transform(icu.begin(), icu.end(), icu.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        for (const auto& alias : statistical_aliases) {
            if (alias.icu != icu) continue;
            double& slot = out[std::string(alias.candidate)];
            slot = std::max(slot, confidence / 100.0);
        }
    }
    return out;
}

double marker_bonus(const EncodingInfo& encoding, Script script, const TextProfile& profile) {
    if (script == Script::korean && profile.hangul * 5 > profile.letters) return kMarkerBonus;
    if (script == Script::japanese && profile.kana * 10 > profile.letters) return kMarkerBonus;
    if (encoding.name == "windows-1254" && profile.turkish >= 3) return kMarkerBonus;
    return 0.0;
}

} // namespace

Bom detect_bom(std::string_view data) {
    using namespace std::string_view_literals;
    if (has_prefix(data, "\xFF\xFE\x00\x00"sv)) return {"utf-32le", 4};
    if (has_prefix(data, "\x00\x00\xFE\xFF"sv)) return {"utf-32be", 4};
    if (has_prefix(data, "\xEF\xBB\xBF"sv)) return {"utf-8", 3};
    if (has_prefix(data, "\xFF\xFE"sv)) return {"utf-16le", 2};
    if (has_prefix(data, "\xFE\xFF"sv)) return {"utf-16be", 2};
    return {};
}

Detector::Detector(const DetectorConfig& config)
    : config_(config)
    , fallback_(resolve_encoding(config.fallback_encoding))
{
    for (const auto& name : config_.candidates) {
        Candidate candidate;
        candidate.encoding = resolve_encoding(name);
        candidate.script = expected_script(candidate.encoding.name);
        candidates_.push_back(std::move(candidate));
    }
}

DetectionResult Detector::detect(std::string_view sample) const {
    std::vector<std::string_view> segments;
    if (!sample.empty()) segments.push_back(sample);
    return detect_segments(segments, true);
}

DetectionResult Detector::detect(const Sample& sample) const {
    return detect_segments(sample.segments(), sample.covers_source);
}

DetectionResult Detector::detect_segments(const std::vector<std::string_view>& segments,
                                          bool complete) const {
    std::size_t total = 0;
    std::size_t high = 0;
    for (auto segment : segments) {
        total += segment.size();
        high += static_cast<std::size_t>(std::count_if(segment.begin(), segment.end(), is_high));
    }
    if (total == 0) {
        return {"utf-8", 1.0f, false};
    }

    const std::string_view head = segments.front();
    Bom bom = detect_bom(head);
    if (bom.length > 0) {
        spdlog::debug("byte-order mark selects {}", bom.encoding);
        return {std::string(bom.encoding), 1.0f, true};
    }

    if (auto wide = detect_wide_unicode(head)) {
        EncodingInfo encoding = resolve_encoding(*wide);
        Decoded decoded = decode_segments(encoding, Script::any, segments, complete);
        double validity = 1.0 - std::min(1.0, static_cast<double>(decoded.invalid_bytes) /
                                                  static_cast<double>(total));
        if (validity >= 0.9) {
            spdlog::debug("NUL pattern selects {} (validity {:.3f})", encoding.name, validity);
            return {encoding.name, static_cast<float>(0.95 * validity), false};
        }
    }

    if (high == 0) {
        return {"utf-8", kAsciiConfidence, false};
    }

    // UTF-8 validates itself: multi-byte text with no invalid sequence is
    // almost never anything else.
    for (const auto& candidate : candidates_) {
        if (candidate.encoding.family != EncodingFamily::utf8) continue;
        Decoded decoded = decode_segments(candidate.encoding, candidate.script, segments, complete);
        if (decoded.invalid_bytes == 0 && decoded.profile.non_ascii > 0) {
            spdlog::debug("sample is valid UTF-8");
            return {candidate.encoding.name, kUtf8Confidence, false};
        }
        break;
    }

    const std::string contiguous = [&] {
        std::string joined;
        joined.reserve(total);
        for (auto segment : segments) joined.append(segment);
        return joined;
    }();
    const std::map<std::string, double> statistics =
        high >= kStatisticalMinHighBytes ? statistical_confidence(contiguous)
                                         : std::map<std::string, double>{};

    const Candidate* best = nullptr;
    double best_score = 0.0;
    for (const auto& candidate : candidates_) {
        Decoded decoded = decode_segments(candidate.encoding, candidate.script, segments, complete);
        const TextProfile& profile = decoded.profile;

        double validity = 1.0 - std::min(1.0, static_cast<double>(decoded.invalid_bytes) /
                                                  static_cast<double>(high));
        double replacement_ratio =
            profile.non_ascii == 0 ? 0.0
                                   : static_cast<double>(decoded.replacements) /
                                         static_cast<double>(profile.non_ascii);
        double text = profile.plausibility(candidate.script);
        auto it = statistics.find(candidate.encoding.name);
        double statistical = it != statistics.end() ? it->second : 0.0;

        double score = validity - kReplacementWeight * std::min(1.0, replacement_ratio) +
                       kPlausibilityWeight * 0.5 * (text + statistical) +
                       marker_bonus(candidate.encoding, candidate.script, profile);

        spdlog::debug("candidate {}: validity {:.3f} text {:.3f} stat {:.3f} score {:.3f}",
                      candidate.encoding.name, validity, text, statistical, score);

        if (!best || score > best_score + kTieEpsilon) {
            best = &candidate;
            best_score = score;
        }
    }

    const float confidence =
        best ? static_cast<float>(std::clamp(best_score / kMaxScore, 0.0, 1.0)) : 0.0f;
    if (!best || confidence < config_.min_confidence) {
        spdlog::debug("no candidate above {:.2f}, falling back to {}", config_.min_confidence,
                      fallback_.name);
        return {fallback_.name, kFallbackConfidence, false};
    }
    return {best->encoding.name, confidence, false};
}

} // namespace transcode::detail
