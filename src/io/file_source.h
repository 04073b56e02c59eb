#pragma once

#include <transcode/source.h>

#include <cstdio>
#include <filesystem>
#include <string>

namespace transcode::detail {

class FileSource : public Source {
public:
    explicit FileSource(const std::filesystem::path& path);
    ~FileSource() override;

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    std::size_t read(char* buf, std::size_t max) override;
    bool at_end() const override;
    SourceInfo info() const override;
    void seek(std::uint64_t offset) override;

private:
    std::FILE* file_ = nullptr;
    std::string path_;
    std::uint64_t size_ = 0;
    bool eof_ = false;
};

} // namespace transcode::detail
