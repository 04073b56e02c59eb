#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace transcode {

class Sink {
public:
    virtual ~Sink() = default;

    // Append bytes. Throws IoError on failure.
    virtual void write(std::string_view bytes) = 0;

    // Make everything written so far visible at the destination.
    // Nothing is visible before commit succeeds.
    virtual void commit() = 0;
};

// Accumulates output in memory.
class StringSink : public Sink {
public:
    void write(std::string_view bytes) override;
    void commit() override;

    const std::string& str() const { return data_; }
    std::string take() { return std::move(data_); }
    bool committed() const { return committed_; }

private:
    std::string data_;
    bool committed_ = false;
};

} // namespace transcode
