#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace otasrv {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);
    out.size_ = 0;

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Result::Fail(errno, "Failed to open " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        const int e = errno;
        out.fd_.Reset();
        return Result::Fail(e, "Failed to stat " + out.path_ + " (" + std::strerror(e) + ")");
    }
    if (!S_ISREG(st.st_mode)) {
        out.fd_.Reset();
        return Result::Fail(EISDIR, "Not a regular file: " + out.path_);
    }
    out.size_ = static_cast<std::uint64_t>(st.st_size);
    return Result::Ok();
}

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

ssize_t FileReader::ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) const {
    while (true) {
        ssize_t n = ::pread(fd_.Get(), out.data(), out.size(), static_cast<off_t>(offset));
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace otasrv
