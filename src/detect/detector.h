#pragma once

#include "../codec/encoding_registry.h"
#include "sampler.h"
#include "text_profile.h"

#include <transcode/encoding.h>
#include <transcode/transcoder.h>

#include <cstddef>
#include <string_view>
#include <vector>

namespace transcode::detail {

struct Bom {
    std::string_view encoding;  // empty when there is none
    std::size_t length = 0;
};

// Byte-order mark at the start of data. UTF-32LE wins over UTF-16LE.
Bom detect_bom(std::string_view data);

class Detector {
public:
    // Resolves every candidate up front; throws LookupError for bad names.
    explicit Detector(const DetectorConfig& config = {});

    // The whole input: a sequence cut off at its end counts as invalid.
    DetectionResult detect(std::string_view sample) const;
    DetectionResult detect(const Sample& sample) const;

private:
    struct Candidate {
        EncodingInfo encoding;
        Script script = Script::any;
    };

    DetectionResult detect_segments(const std::vector<std::string_view>& segments,
                                    bool complete) const;

    DetectorConfig config_;
    std::vector<Candidate> candidates_;
    EncodingInfo fallback_;
};

} // namespace transcode::detail
