#include "memory_source.h"

#include <transcode/error.h>

#include <algorithm>
#include <utility>

namespace transcode::detail {

MemorySource::MemorySource(std::string data, std::size_t max_read)
    : data_(std::move(data))
    , max_read_(max_read)
{
}

std::size_t MemorySource::read(char* buf, std::size_t max) {
    std::size_t avail = data_.size() - pos_;
    std::size_t to_copy = std::min(avail, max);
    if (max_read_ > 0) {
        to_copy = std::min(to_copy, max_read_);
    }
    std::copy(data_.data() + pos_, data_.data() + pos_ + to_copy, buf);
    pos_ += to_copy;
    return to_copy;
}

bool MemorySource::at_end() const {
    return pos_ >= data_.size();
}

SourceInfo MemorySource::info() const {
    return {"memory(" + std::to_string(data_.size()) + " bytes)", data_.size(), true};
}

void MemorySource::seek(std::uint64_t offset) {
    if (offset > data_.size()) {
        throw IoError("seek past end of " + info().name);
    }
    pos_ = static_cast<std::size_t>(offset);
}

} // namespace transcode::detail
