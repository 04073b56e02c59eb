#pragma once

#include <transcode/source.h>

#include <cstddef>
#include <string>

namespace transcode::detail {

// Serves bytes already taken from a non-seekable source (the detection
// sample) and then continues with the source itself.
class ReplaySource : public Source {
public:
    ReplaySource(std::string prefix, Source& rest);

    ReplaySource(const ReplaySource&) = delete;
    ReplaySource& operator=(const ReplaySource&) = delete;

    std::size_t read(char* buf, std::size_t max) override;
    bool at_end() const override;
    SourceInfo info() const override;
    void seek(std::uint64_t offset) override;

private:
    std::string prefix_;
    std::size_t pos_ = 0;
    Source& rest_;
};

} // namespace transcode::detail
