#pragma once

#include "util/result.hpp"

#include <memory>
#include <string_view>

namespace hotpush {

// Filesystem mutations used by the update pipeline. Delete and
// EnsureDirectoryExists succeed when there is nothing to do.
class IFileSystem {
  public:
    virtual ~IFileSystem() = default;
    virtual Result Delete(std::string_view path) const = 0;
    virtual Result EnsureDirectoryExists(std::string_view path) const = 0;
    virtual Result Rename(std::string_view from, std::string_view to) const = 0;
};

class LocalFileSystem final : public IFileSystem {
  public:
    Result Delete(std::string_view path) const override;
    Result EnsureDirectoryExists(std::string_view path) const override;
    Result Rename(std::string_view from, std::string_view to) const override;
};

std::shared_ptr<const IFileSystem> DefaultFileSystem();

} // namespace hotpush
