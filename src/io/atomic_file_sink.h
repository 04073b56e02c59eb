#pragma once

#include <transcode/sink.h>

#include <filesystem>
#include <string_view>

namespace transcode::detail {

// Writes to a temp file beside the destination and renames it over the
// destination on commit. Destroying an uncommitted sink removes the temp
// file and leaves the destination as it was.
class AtomicFileSink : public Sink {
public:
    explicit AtomicFileSink(const std::filesystem::path& destination);
    ~AtomicFileSink() override;

    AtomicFileSink(const AtomicFileSink&) = delete;
    AtomicFileSink& operator=(const AtomicFileSink&) = delete;

    void write(std::string_view bytes) override;
    void commit() override;

    // Close and remove the temp file now. No-op after commit.
    void discard() noexcept;

    const std::filesystem::path& temp_path() const { return temp_path_; }
    const std::filesystem::path& destination() const { return destination_; }

private:
    std::filesystem::path destination_;
    std::filesystem::path temp_path_;
    int fd_ = -1;
    bool committed_ = false;
};

} // namespace transcode::detail
