#include <transcode/transcoder.h>

#include <transcode/error.h>

#include "codec/codec.h"
#include "codec/encoding_registry.h"
#include "detect/detector.h"
#include "detect/sampler.h"
#include "io/atomic_file_sink.h"
#include "io/file_source.h"
#include "io/replay_source.h"
#include "stream/chunk_state.h"
#include "stream/newline_normalizer.h"
#include "stream/stream_decoder.h"
#include "stream/stream_encoder.h"

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace transcode {

namespace {

using detail::ByteOrder;
using detail::EncodingFamily;
using detail::EncodingInfo;

// Longest byte-order mark.
constexpr std::size_t kBomProbe = 4;

struct SourceBom {
    std::size_t length = 0;
    ByteOrder order = ByteOrder::none;
};

bool has_prefix(std::string_view data, std::string_view prefix) {
    return data.size() >= prefix.size() && data.substr(0, prefix.size()) == prefix;
}

// A BOM at the start of head that belongs to the source encoding. For an
// explicit byte order only the matching mark counts; the other one is
// ordinary (if unusual) text.
SourceBom match_bom(std::string_view head, const EncodingInfo& encoding) {
    using namespace std::string_view_literals;
    SourceBom bom;
    switch (encoding.family) {
    case EncodingFamily::utf8:
        if (has_prefix(head, "\xEF\xBB\xBF"sv)) bom = {3, ByteOrder::none};
        return bom;
    case EncodingFamily::utf16:
        if (has_prefix(head, "\xFF\xFE"sv)) bom = {2, ByteOrder::little};
        else if (has_prefix(head, "\xFE\xFF"sv)) bom = {2, ByteOrder::big};
        break;
    case EncodingFamily::utf32:
        if (has_prefix(head, "\xFF\xFE\x00\x00"sv)) bom = {4, ByteOrder::little};
        else if (has_prefix(head, "\x00\x00\xFE\xFF"sv)) bom = {4, ByteOrder::big};
        break;
    default:
        return bom;
    }
    if (!encoding.bom_sensing() && bom.order != encoding.byte_order) return {};
    return bom;
}

// Decoder for a stream whose first bytes are head. Strips the BOM from head.
std::unique_ptr<detail::Decoder> open_decoder(const EncodingInfo& encoding,
                                              std::string_view& head) {
    SourceBom bom = match_bom(head, encoding);
    head.remove_prefix(bom.length);
    if (encoding.bom_sensing()) {
        ByteOrder order = bom.order == ByteOrder::none ? ByteOrder::big : bom.order;
        return detail::make_decoder(detail::with_byte_order(encoding, order));
    }
    return detail::make_decoder(encoding);
}

// One conversion: source -> decode -> (normalize) -> encode -> sink.
// Everything it holds is proportional to chunk_size.
class StreamingSession {
public:
    StreamingSession(Source& source, Sink& sink, const EncodingInfo& from,
                     const EncodingInfo& to, std::optional<NewlineStyle> newlines,
                     std::size_t chunk_size)
        : source_(source)
        , sink_(sink)
        , from_(from)
        , encoder_(detail::make_encoder(to))
        , buffer_(chunk_size)
    {
        if (newlines) normalizer_.emplace(*newlines);
    }

    void run(ConversionStats& stats) {
        // The BOM check needs the first few bytes together, whatever the
        // chunk size.
        std::string head;
        while (head.size() < kBomProbe) {
            std::size_t n = source_.read(buffer_.data(), buffer_.size());
            if (n == 0) break;
            head.append(buffer_.data(), n);
            stats.bytes_read += n;
        }

        std::string_view first = head;
        decoder_.emplace(open_decoder(from_, first));
        process(first, false, stats);

        for (;;) {
            std::size_t n = source_.read(buffer_.data(), buffer_.size());
            if (n == 0) break;
            stats.bytes_read += n;
            process(std::string_view(buffer_.data(), n), false, stats);
        }
        process({}, true, stats);

        stats.decode_replacements = decoder_->replacements();
        stats.encode_replacements = encoder_.replacements();
    }

private:
    void process(std::string_view raw, bool is_last, ConversionStats& stats) {
        std::string text = decoder_->decode_chunk(raw, state_, is_last);
        if (normalizer_) {
            text = normalizer_->normalize_chunk(text, state_.pending_cr);
            if (is_last) text += normalizer_->flush(state_.pending_cr);
        }
        std::string bytes = encoder_.encode_chunk(text, is_last);
        if (!bytes.empty()) {
            sink_.write(bytes);
            stats.bytes_written += bytes.size();
        }
        if (!raw.empty()) ++stats.chunks;
    }

    Source& source_;
    Sink& sink_;
    EncodingInfo from_;
    std::optional<detail::StreamDecoder> decoder_;
    std::optional<detail::NewlineNormalizer> normalizer_;
    detail::StreamEncoder encoder_;
    detail::ChunkState state_;
    std::vector<char> buffer_;
};

struct SampleScan {
    detail::NewlineCounts newlines;
    std::size_t replacements = 0;
};

// Decode the sample as `detection` says and count its line terminators.
SampleScan scan_sample(const detail::Sample& sample, const DetectionResult& detection) {
    SampleScan scan;
    std::vector<std::string_view> segments = sample.segments();
    if (segments.empty()) return scan;

    EncodingInfo encoding = detail::resolve_encoding(detection.encoding);
    std::string_view head = segments.front();
    detail::StreamDecoder decoder(open_decoder(encoding, head));
    segments.front() = head;

    detail::NewlineNormalizer normalizer(NewlineStyle::lf);
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const bool last = i + 1 == segments.size();
        // Slices are not contiguous: nothing carries from one to the next.
        detail::ChunkState state;
        std::string text = decoder.decode_chunk(segments[i], state, last && sample.covers_source);
        normalizer.normalize_chunk(text, state.pending_cr);
        if (last && sample.covers_source) normalizer.flush(state.pending_cr);
    }
    scan.newlines = normalizer.counts();
    scan.replacements = decoder.replacements();
    return scan;
}

} // namespace

struct Transcoder::Impl {
    TranscoderConfig config;
    detail::Detector detector;

    explicit Impl(const TranscoderConfig& c)
        : config(c)
        , detector(c.detector)
    {
        if (config.chunk_size == 0) {
            throw ValueError("chunk_size must be positive");
        }
        if (config.sampling.max_sample_size == 0) {
            throw ValueError("max_sample_size must be positive");
        }
    }

    ConversionStats run(Source& source, Sink& sink, const EncodingInfo& from,
                        const EncodingInfo& to, std::optional<NewlineStyle> newlines,
                        std::size_t chunk_size, const DetectionResult& detection) const {
        const std::string name = source.info().name;
        if (newlines) {
            spdlog::debug("{}: {} -> {}, {} line endings", name, from.name, to.name,
                          to_string(*newlines));
        } else {
            spdlog::debug("{}: {} -> {}", name, from.name, to.name);
        }

        ConversionStats stats;
        stats.source = detection;
        StreamingSession session(source, sink, from, to, newlines, chunk_size);
        session.run(stats);
        sink.commit();

        if (stats.decode_replacements > 0) {
            spdlog::warn("{}: replaced {} invalid {} sequences", name, stats.decode_replacements,
                         from.name);
        }
        if (stats.encode_replacements > 0) {
            spdlog::warn("{}: replaced {} characters not representable in {}", name,
                         stats.encode_replacements, to.name);
        }
        spdlog::debug("{}: read {} bytes, wrote {} bytes in {} chunks", name, stats.bytes_read,
                      stats.bytes_written, stats.chunks);
        return stats;
    }

    bool already_normalized(const detail::Sample& sample, const DetectionResult& detection,
                            const EncodingInfo& target, NewlineStyle newlines) const {
        if (!config.skip_when_normalized || !sample.covers_source) return false;
        if (detection.bom_present || detection.encoding != target.name) return false;

        SampleScan scan = scan_sample(sample, detection);
        if (scan.replacements > 0) return false;
        const detail::NewlineCounts& counts = scan.newlines;
        switch (newlines) {
        case NewlineStyle::lf:   return counts.crlf == 0 && counts.cr == 0;
        case NewlineStyle::crlf: return counts.lf == 0 && counts.cr == 0;
        case NewlineStyle::cr:   return counts.lf == 0 && counts.crlf == 0;
        }
        return false;
    }

    ConversionStats normalize(const std::filesystem::path& source,
                              const std::filesystem::path& destination, std::string_view encoding,
                              NewlineStyle newlines, bool in_place) const {
        const EncodingInfo target = detail::resolve_encoding(encoding);

        detail::FileSource input(source);
        detail::Sample sample = detail::take_sample(input, config.sampling);
        DetectionResult detection = detector.detect(sample);

        if (in_place && already_normalized(sample, detection, target, newlines)) {
            spdlog::debug("{}: already {} with {} line endings", source.string(), target.name,
                          to_string(newlines));
            ConversionStats stats;
            stats.skipped = true;
            stats.source = detection;
            return stats;
        }

        const EncodingInfo from = detail::resolve_encoding(detection.encoding);
        detail::AtomicFileSink sink(destination);
        return run(input, sink, from, target, newlines, config.chunk_size, detection);
    }
};

Transcoder::Transcoder(const TranscoderConfig& config)
    : impl_(std::make_unique<Impl>(config))
{
}

Transcoder::~Transcoder() = default;
Transcoder::Transcoder(Transcoder&&) noexcept = default;
Transcoder& Transcoder::operator=(Transcoder&&) noexcept = default;

const TranscoderConfig& Transcoder::config() const {
    return impl_->config;
}

DetectionResult Transcoder::detect(const std::filesystem::path& path) const {
    detail::Sample sample = detail::take_sample(path, impl_->config.sampling);
    DetectionResult result = impl_->detector.detect(sample);
    spdlog::debug("{}: detected {} ({:.2f})", path.string(), result.encoding, result.confidence);
    return result;
}

AnalysisResult Transcoder::analyse(const std::filesystem::path& path) const {
    detail::Sample sample = detail::take_sample(path, impl_->config.sampling);
    AnalysisResult result;
    result.detection = impl_->detector.detect(sample);
    SampleScan scan = scan_sample(sample, result.detection);
    result.newlines = scan.newlines.dominant();
    result.mixed_newlines = scan.newlines.mixed();
    return result;
}

std::string Transcoder::convert(const std::filesystem::path& path, std::string_view to,
                                std::string_view from) const {
    const EncodingInfo target = detail::resolve_encoding(to);

    StreamOptions options;
    options.source_encoding = std::string(from);
    options.target_encoding = target.name;
    options.chunk_size = impl_->config.chunk_size;

    detail::FileSource input(path);
    StringSink sink;
    transcode(input, sink, options);
    return sink.take();
}

ConversionStats Transcoder::normalize(const std::filesystem::path& path,
                                      std::string_view encoding, NewlineStyle newlines) const {
    return impl_->normalize(path, path, encoding, newlines, true);
}

ConversionStats Transcoder::normalize_to(const std::filesystem::path& source,
                                         const std::filesystem::path& destination,
                                         std::string_view encoding,
                                         NewlineStyle newlines) const {
    return impl_->normalize(source, destination, encoding, newlines, false);
}

ConversionStats Transcoder::transcode(Source& source, Sink& sink,
                                      const StreamOptions& options) const {
    if (options.chunk_size == 0) {
        throw ValueError("chunk_size must be positive");
    }
    const EncodingInfo target = detail::resolve_encoding(options.target_encoding);

    if (!options.source_encoding.empty()) {
        const EncodingInfo from = detail::resolve_encoding(options.source_encoding);
        DetectionResult given{from.name, 1.0f, false};
        return impl_->run(source, sink, from, target, options.newlines, options.chunk_size, given);
    }

    detail::Sample sample = detail::take_sample(source, impl_->config.sampling);
    DetectionResult detection = impl_->detector.detect(sample);
    const EncodingInfo from = detail::resolve_encoding(detection.encoding);

    if (source.info().seekable) {
        return impl_->run(source, sink, from, target, options.newlines, options.chunk_size,
                          detection);
    }
    detail::ReplaySource replay(std::move(sample.bytes), source);
    return impl_->run(replay, sink, from, target, options.newlines, options.chunk_size,
                      detection);
}

std::string detect(const std::filesystem::path& path, std::size_t max_sample_size) {
    TranscoderConfig config;
    config.sampling.max_sample_size = max_sample_size;
    return Transcoder(config).detect(path).encoding;
}

std::string convert(const std::filesystem::path& path, std::string_view to,
                    std::size_t max_sample_size) {
    TranscoderConfig config;
    config.sampling.max_sample_size = max_sample_size;
    return Transcoder(config).convert(path, to);
}

void normalize(const std::filesystem::path& path, std::string_view encoding,
               NewlineStyle newlines, std::size_t max_sample_size) {
    TranscoderConfig config;
    config.sampling.max_sample_size = max_sample_size;
    Transcoder(config).normalize(path, encoding, newlines);
}

} // namespace transcode
