#include "atomic_file_sink.h"

#include <transcode/error.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace transcode::detail {

namespace {

std::string describe_errno() {
    return std::strerror(errno);
}

void sync_directory(const std::filesystem::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) return;  // not every filesystem lets us open a directory
    ::fsync(fd);
    ::close(fd);
}

} // namespace

AtomicFileSink::AtomicFileSink(const std::filesystem::path& destination)
    : destination_(destination)
{
    std::filesystem::path dir = destination_.parent_path();
    if (dir.empty()) dir = ".";

    std::string tmpl = (dir / ("." + destination_.filename().string() + ".tmp-XXXXXX")).string();
    fd_ = ::mkstemp(tmpl.data());
    if (fd_ < 0) {
        throw IoError("cannot create temp file in " + dir.string() + " (" + describe_errno() + ")");
    }
    temp_path_ = tmpl;

    // Replacing a file keeps its permission bits.
    struct stat st;
    if (::stat(destination_.c_str(), &st) == 0) {
        if (::fchmod(fd_, st.st_mode & 07777) != 0) {
            std::string reason = describe_errno();
            discard();
            throw IoError("cannot set mode on " + temp_path_.string() + " (" + reason + ")");
        }
    }
}

AtomicFileSink::~AtomicFileSink() {
    if (!committed_ && fd_ >= 0) {
        spdlog::error("discarding incomplete output for {}", destination_.string());
    }
    discard();
}

void AtomicFileSink::write(std::string_view bytes) {
    if (fd_ < 0) {
        throw IoError("write to closed output: " + destination_.string());
    }
    const char* p = bytes.data();
    std::size_t left = bytes.size();
    while (left > 0) {
        ssize_t n = ::write(fd_, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw IoError("write failed: " + temp_path_.string() + " (" + describe_errno() + ")");
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }
}

void AtomicFileSink::commit() {
    if (fd_ < 0) {
        throw IoError("commit of closed output: " + destination_.string());
    }
    if (::fsync(fd_) != 0) {
        throw IoError("fsync failed: " + temp_path_.string() + " (" + describe_errno() + ")");
    }
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        std::string reason = describe_errno();
        std::remove(temp_path_.c_str());
        throw IoError("close failed: " + temp_path_.string() + " (" + reason + ")");
    }
    if (std::rename(temp_path_.c_str(), destination_.c_str()) != 0) {
        std::string reason = describe_errno();
        std::remove(temp_path_.c_str());
        throw IoError("cannot replace " + destination_.string() + " (" + reason + ")");
    }
    committed_ = true;

    std::filesystem::path dir = destination_.parent_path();
    sync_directory(dir.empty() ? std::filesystem::path(".") : dir);
}

void AtomicFileSink::discard() noexcept {
    if (committed_) return;
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (!temp_path_.empty()) {
        std::remove(temp_path_.c_str());
        temp_path_.clear();
    }
}

} // namespace transcode::detail
