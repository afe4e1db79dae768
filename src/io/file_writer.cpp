// file_writer.cpp - Writer implementation for regular files.

#include "io/file_writer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace hotpush {

Result FileWriter::Open(std::string path, FileWriter& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(
            err, "Failed to open output: " + out.path_ + " (" + std::strerror(err) + ")");
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int err = errno;
        return Result::Fail(err, "Write failed: " + path_ + " (" + std::strerror(err) + ")");
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        const int err = errno;
        return Result::Fail(err, "fsync failed: " + path_ + " (" + std::strerror(err) + ")");
    }
    return Result::Ok();
}

Result FileWriter::Close() {
    const int fd = fd_.Release();
    if (fd >= 0 && ::close(fd) == -1) {
        const int err = errno;
        return Result::Fail(err, "close failed: " + path_ + " (" + std::strerror(err) + ")");
    }
    return Result::Ok();
}

Result WriteFileAtomically(const std::string& path, std::string_view contents) {
    const std::string tmp_path = path + ".tmp";

    FileWriter writer;
    auto res = FileWriter::Open(tmp_path, writer);
    if (!res.is_ok())
        return res;

    res = writer.WriteAll(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(contents.data()), contents.size()));
    if (res.is_ok())
        res = writer.FsyncNow();
    if (res.is_ok())
        res = writer.Close();
    if (!res.is_ok()) {
        ::unlink(tmp_path.c_str());
        return res;
    }

    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return Result::Fail(err, "rename failed: " + tmp_path + " -> " + path + " (" +
                                     std::strerror(err) + ")");
    }
    return Result::Ok();
}

} // namespace hotpush
