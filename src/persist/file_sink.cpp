#include "persist/file_sink.hpp"

#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace persist {
namespace {

IoResult failed(int err) noexcept { return IoResult{false, err}; }
constexpr IoResult ok{true, 0};

} // namespace

PosixFileSink::PosixFileSink() = default;
PosixFileSink::~PosixFileSink() { close(); }

IoResult PosixFileSink::open(const std::string& path) noexcept {
    close();
    const int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) {
        return failed(errno);
    }
    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        const int err = errno;
        ::close(fd);
        return failed(err);
    }
    fd_ = fd;
    size_bytes_ = static_cast<std::uint64_t>(st.st_size);
    return ok;
}

void PosixFileSink::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    size_bytes_ = 0;
}

// Writes at the tracked end so a truncate() rollback and the next append agree on
// the offset. size_bytes_ only moves once the whole frame is on disk; a short write
// leaves bytes past it for the caller to truncate away.
IoResult PosixFileSink::append(std::span<const std::byte> data) noexcept {
    if (fd_ < 0) {
        return failed(EBADF);
    }
    std::size_t done = 0;
    while (done < data.size()) {
        const auto at = static_cast<off_t>(size_bytes_ + done);
        const ssize_t n = ::pwrite(fd_, data.data() + done, data.size() - done, at);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return failed(n < 0 ? errno : EIO);
        }
        done += static_cast<std::size_t>(n);
    }
    size_bytes_ += done;
    return ok;
}

IoResult PosixFileSink::sync() noexcept {
    if (fd_ < 0) {
        return failed(EBADF);
    }
    return ::fdatasync(fd_) == 0 ? ok : failed(errno);
}

IoResult PosixFileSink::truncate(std::uint64_t size) noexcept {
    if (fd_ < 0) {
        return failed(EBADF);
    }
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        return failed(errno);
    }
    size_bytes_ = size;
    // The cut must survive a crash, or recovery would replay the rolled back frame.
    return sync();
}

bool PosixFileSink::is_open() const noexcept { return fd_ >= 0; }

} // namespace persist
