#include "file_source.h"

#include <transcode/error.h>

#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace transcode::detail {

namespace {

std::string describe_errno() {
    return std::strerror(errno);
}

} // namespace

FileSource::FileSource(const std::filesystem::path& path)
    : path_(path.string())
{
    file_ = std::fopen(path_.c_str(), "rb");
    if (!file_) {
        throw IoError("cannot open file: " + path_ + " (" + describe_errno() + ")");
    }

    struct stat st;
    if (fstat(fileno(file_), &st) < 0) {
        std::string reason = describe_errno();
        std::fclose(file_);
        throw IoError("fstat failed: " + path_ + " (" + reason + ")");
    }
    if (S_ISDIR(st.st_mode)) {
        std::fclose(file_);
        throw IoError("is a directory: " + path_);
    }
    size_ = static_cast<std::uint64_t>(st.st_size);
}

FileSource::~FileSource() {
    if (file_) {
        std::fclose(file_);
    }
}

std::size_t FileSource::read(char* buf, std::size_t max) {
    if (!file_ || eof_ || max == 0) return 0;
    std::size_t n = std::fread(buf, 1, max, file_);
    if (n < max) {
        if (std::ferror(file_)) {
            throw IoError("read failed: " + path_ + " (" + describe_errno() + ")");
        }
        eof_ = true;
    }
    return n;
}

bool FileSource::at_end() const {
    return eof_;
}

SourceInfo FileSource::info() const {
    return {path_, size_, true};
}

void FileSource::seek(std::uint64_t offset) {
    if (fseeko(file_, static_cast<off_t>(offset), SEEK_SET) != 0) {
        throw IoError("seek failed: " + path_ + " (" + describe_errno() + ")");
    }
    eof_ = offset >= size_;
}

} // namespace transcode::detail
