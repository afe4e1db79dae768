#include "io/file_system.hpp"

#include <cerrno>
#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace hotpush {

namespace {

Result FromErrorCode(const std::error_code& ec, const std::string& what) {
    return Result::Fail(ec.value(), what + " (" + ec.message() + ")");
}

} // namespace

Result LocalFileSystem::Delete(std::string_view path) const {
    if (path.empty())
        return Result::Fail(EINVAL, "delete: empty path");

    std::error_code ec;
    fs::remove_all(fs::path(path), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return FromErrorCode(ec, "delete failed: " + std::string(path));
    }
    return Result::Ok();
}

Result LocalFileSystem::EnsureDirectoryExists(std::string_view path) const {
    if (path.empty())
        return Result::Fail(EINVAL, "mkdir: empty path");

    std::error_code ec;
    fs::create_directories(fs::path(path), ec);
    if (ec) {
        return FromErrorCode(ec, "mkdir failed: " + std::string(path));
    }
    if (!fs::is_directory(fs::path(path), ec)) {
        return Result::Fail(ENOTDIR, "not a directory: " + std::string(path));
    }
    return Result::Ok();
}

Result LocalFileSystem::Rename(std::string_view from, std::string_view to) const {
    std::error_code ec;
    fs::rename(fs::path(from), fs::path(to), ec);
    if (ec) {
        return FromErrorCode(ec, "rename failed: " + std::string(from) + " -> " + std::string(to));
    }
    return Result::Ok();
}

std::shared_ptr<const IFileSystem> DefaultFileSystem() {
    static const std::shared_ptr<const IFileSystem> kDefault = std::make_shared<LocalFileSystem>();
    return kDefault;
}

} // namespace hotpush
