#pragma once

#include <transcode/source.h>
#include <transcode/transcoder.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace transcode::detail {

struct Sample {
    std::string bytes;
    // Offsets into bytes where each contiguous slice of the source begins.
    // The first segment starts at source offset 0.
    std::vector<std::size_t> segment_starts;
    std::uint64_t source_size = 0;
    bool covers_source = false;

    std::vector<std::string_view> segments() const;
};

// Bytes to sample from a source of `size` bytes.
std::size_t sample_budget(std::uint64_t size, const SamplePolicy& policy);

// Up to max_sample_size bytes from the current position of source.
std::string sample(Source& source, std::size_t max_sample_size);

// Whole source when it fits the budget, otherwise head, evenly spaced
// middle slices and tail (seekable sources) or head only. Leaves a seekable
// source positioned at offset 0.
Sample take_sample(Source& source, const SamplePolicy& policy);

// Opens the file on its own; throws IoError.
Sample take_sample(const std::filesystem::path& path, const SamplePolicy& policy);

} // namespace transcode::detail
