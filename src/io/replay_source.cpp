#include "replay_source.h"

#include <transcode/error.h>

#include <algorithm>
#include <utility>

namespace transcode::detail {

ReplaySource::ReplaySource(std::string prefix, Source& rest)
    : prefix_(std::move(prefix))
    , rest_(rest)
{
}

std::size_t ReplaySource::read(char* buf, std::size_t max) {
    if (pos_ < prefix_.size()) {
        std::size_t n = std::min(max, prefix_.size() - pos_);
        std::copy(prefix_.data() + pos_, prefix_.data() + pos_ + n, buf);
        pos_ += n;
        if (pos_ == prefix_.size()) {
            // Release the sample once it has been replayed.
            std::string().swap(prefix_);
            pos_ = 0;
        }
        return n;
    }
    return rest_.read(buf, max);
}

bool ReplaySource::at_end() const {
    return pos_ >= prefix_.size() && rest_.at_end();
}

SourceInfo ReplaySource::info() const {
    SourceInfo info = rest_.info();
    info.seekable = false;
    return info;
}

void ReplaySource::seek(std::uint64_t) {
    throw IoError("cannot seek " + rest_.info().name);
}

} // namespace transcode::detail
