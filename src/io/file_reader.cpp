#include "io/file_reader.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace hotpush {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(
            err, "Failed to open input: " + out.path_ + " (" + std::strerror(err) + ")");
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) == 0 && st.st_size > 0) {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    } else {
        out.size_ = std::nullopt;
    }

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

Result FileReader::ReadToString(std::string& out) {
    out.clear();
    if (size_)
        out.reserve(static_cast<size_t>(*size_));

    std::array<std::uint8_t, 16 * 1024> buf{};
    while (true) {
        const ssize_t n = Read(buf);
        if (n == 0)
            break;
        if (n < 0) {
            const int err = errno;
            return Result::Fail(err, "Read failed: " + path_ + " (" + std::strerror(err) + ")");
        }
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return Result::Ok();
}

} // namespace hotpush
