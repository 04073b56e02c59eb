#pragma once

#include <transcode/source.h>

#include <cstddef>
#include <string>

namespace transcode::detail {

// Serves bytes held in memory. `max_read` caps how much one read() returns,
// which lets callers reproduce short reads from pipes and sockets.
class MemorySource : public Source {
public:
    explicit MemorySource(std::string data, std::size_t max_read = 0);

    std::size_t read(char* buf, std::size_t max) override;
    bool at_end() const override;
    SourceInfo info() const override;
    void seek(std::uint64_t offset) override;

private:
    std::string data_;
    std::size_t max_read_;
    std::size_t pos_ = 0;
};

} // namespace transcode::detail
