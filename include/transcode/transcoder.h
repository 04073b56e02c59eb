#pragma once

#include <transcode/encoding.h>
#include <transcode/sink.h>
#include <transcode/source.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace transcode {

inline constexpr std::size_t kDefaultSampleSize = 1024 * 1024;
inline constexpr std::size_t kDefaultChunkSize = 8 * 1024;

struct SamplePolicy {
    std::size_t max_sample_size = kDefaultSampleSize;
    // Adaptive budget: when percentage > 0 the budget becomes
    // min(max_sample_size, max(min_sample_size, size * percentage)).
    std::size_t min_sample_size = 0;
    double percentage = 0.0;
    // Spread the budget over head, middle and tail of large seekable sources.
    bool strategic = true;
};

struct DetectorConfig {
    // Scored in order; earlier entries win ties.
    std::vector<std::string> candidates = {
        "utf-8",        "windows-1252", "iso-8859-1",     "windows-1250",
        "windows-1251", "windows-1253", "windows-1254",   "windows-1255",
        "windows-1256", "koi8-r",       "x-mac-cyrillic", "shift_jis",
        "euc-jp",       "gbk",          "big5",           "euc-kr",
    };
    std::string fallback_encoding = "iso-8859-1";
    float min_confidence = 0.35f;
};

struct TranscoderConfig {
    std::size_t chunk_size = kDefaultChunkSize;
    SamplePolicy sampling;
    DetectorConfig detector;
    // normalize() leaves a file alone when the sample proves it already
    // has the target encoding and line endings.
    bool skip_when_normalized = true;
};

struct StreamOptions {
    std::string source_encoding;
    std::string target_encoding = "utf-8";
    std::optional<NewlineStyle> newlines;
    std::size_t chunk_size = kDefaultChunkSize;
};

struct ConversionStats {
    std::uint64_t bytes_read = 0;
    std::uint64_t bytes_written = 0;
    std::size_t chunks = 0;
    std::size_t decode_replacements = 0;
    std::size_t encode_replacements = 0;
    bool skipped = false;
    DetectionResult source;
};

class Transcoder {
public:
    explicit Transcoder(const TranscoderConfig& config = {});
    ~Transcoder();

    Transcoder(const Transcoder&) = delete;
    Transcoder& operator=(const Transcoder&) = delete;
    Transcoder(Transcoder&&) noexcept;
    Transcoder& operator=(Transcoder&&) noexcept;

    const TranscoderConfig& config() const;

    // Sample the file and guess its encoding.
    DetectionResult detect(const std::filesystem::path& path) const;

    // Encoding plus the line-ending style found in the sample.
    AnalysisResult analyse(const std::filesystem::path& path) const;

    // Whole file converted to `to`, returned in memory. An empty `from`
    // runs detection first.
    std::string convert(const std::filesystem::path& path, std::string_view to,
                        std::string_view from = {}) const;

    // Rewrite the file in place through a temp file and atomic rename.
    ConversionStats normalize(const std::filesystem::path& path, std::string_view encoding,
                              NewlineStyle newlines) const;

    // Same as normalize() but writes to `destination`, which is replaced
    // atomically. `source` is never modified.
    ConversionStats normalize_to(const std::filesystem::path& source,
                                 const std::filesystem::path& destination,
                                 std::string_view encoding, NewlineStyle newlines) const;

    // Generic streaming entry point. The sink is committed on success.
    ConversionStats transcode(Source& source, Sink& sink, const StreamOptions& options) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Convenience wrappers over a default-configured Transcoder.
std::string detect(const std::filesystem::path& path,
                   std::size_t max_sample_size = kDefaultSampleSize);

std::string convert(const std::filesystem::path& path, std::string_view to,
                    std::size_t max_sample_size = kDefaultSampleSize);

void normalize(const std::filesystem::path& path, std::string_view encoding,
               NewlineStyle newlines, std::size_t max_sample_size = kDefaultSampleSize);

} // namespace transcode
