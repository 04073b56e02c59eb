#include "sampler.h"

#include "../io/file_source.h"

#include <algorithm>
#include <cmath>

namespace transcode::detail {

namespace {

constexpr double kHeadShare = 0.35;
constexpr double kTailShare = 0.15;
constexpr double kMiddleSliceShare = 0.05;

// Slice offsets stay on 4-byte boundaries so UTF-16/32 code units line up.
std::uint64_t align_down(std::uint64_t offset) {
    return offset & ~std::uint64_t{3};
}

std::size_t read_fully(Source& source, char* buf, std::size_t n) {
    std::size_t total = 0;
    while (total < n) {
        std::size_t got = source.read(buf + total, n - total);
        if (got == 0) break;
        total += got;
    }
    return total;
}

void append_slice(Sample& out, Source& source, std::uint64_t offset, std::size_t length) {
    if (length == 0) return;
    source.seek(offset);
    std::size_t start = out.bytes.size();
    out.bytes.resize(start + length);
    std::size_t got = read_fully(source, out.bytes.data() + start, length);
    out.bytes.resize(start + got);
    if (got > 0) out.segment_starts.push_back(start);
}

} // namespace

std::vector<std::string_view> Sample::segments() const {
    std::vector<std::string_view> out;
    std::string_view all = bytes;
    for (std::size_t i = 0; i < segment_starts.size(); ++i) {
        std::size_t begin = segment_starts[i];
        std::size_t end = (i + 1 < segment_starts.size()) ? segment_starts[i + 1] : bytes.size();
        out.push_back(all.substr(begin, end - begin));
    }
    return out;
}

std::size_t sample_budget(std::uint64_t size, const SamplePolicy& policy) {
    std::size_t budget = policy.max_sample_size;
    if (policy.percentage > 0.0) {
        auto scaled = static_cast<std::size_t>(static_cast<double>(size) * policy.percentage);
        budget = std::min(policy.max_sample_size, std::max(policy.min_sample_size, scaled));
    }
    return budget;
}

std::string sample(Source& source, std::size_t max_sample_size) {
    std::string bytes(max_sample_size, '\0');
    bytes.resize(read_fully(source, bytes.data(), max_sample_size));
    return bytes;
}

Sample take_sample(Source& source, const SamplePolicy& policy) {
    const SourceInfo info = source.info();
    Sample out;
    out.source_size = info.size_bytes;

    if (!info.seekable) {
        out.bytes = sample(source, policy.max_sample_size);
        if (!out.bytes.empty()) out.segment_starts.push_back(0);
        out.covers_source = source.at_end();
        return out;
    }

    const std::size_t budget = sample_budget(info.size_bytes, policy);
    const auto middle_slice = static_cast<std::size_t>(budget * kMiddleSliceShare);

    if (info.size_bytes <= budget || !policy.strategic || middle_slice == 0) {
        auto length = static_cast<std::size_t>(std::min<std::uint64_t>(info.size_bytes, budget));
        append_slice(out, source, 0, length);
        out.covers_source = info.size_bytes <= budget;
        source.seek(0);
        return out;
    }

    const auto head_size = static_cast<std::size_t>(budget * kHeadShare);
    const auto tail_size = static_cast<std::size_t>(budget * kTailShare);
    const std::size_t middle_total = budget - head_size - tail_size;
    const auto slices = static_cast<std::size_t>(
        std::ceil(static_cast<double>(middle_total) / static_cast<double>(middle_slice)));

    out.bytes.reserve(budget);
    append_slice(out, source, 0, head_size);

    const std::uint64_t middle_start = head_size;
    const std::uint64_t tail_start = align_down(info.size_bytes - tail_size);
    const std::uint64_t middle_length = tail_start > middle_start ? tail_start - middle_start : 0;
    for (std::size_t i = 0; i < slices && middle_length > 0; ++i) {
        std::uint64_t pos = align_down(middle_start + middle_length * i / slices);
        pos = std::max(pos, align_down(middle_start + 3));
        if (pos >= tail_start) break;
        auto length =
            static_cast<std::size_t>(std::min<std::uint64_t>(middle_slice, tail_start - pos));
        append_slice(out, source, pos, length);
    }

    append_slice(out, source, tail_start, static_cast<std::size_t>(info.size_bytes - tail_start));
    source.seek(0);
    return out;
}

Sample take_sample(const std::filesystem::path& path, const SamplePolicy& policy) {
    FileSource source(path);
    return take_sample(source, policy);
}

} // namespace transcode::detail
