#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>
#include <string_view>

namespace hotpush {

// Creates or truncates a regular file for writing.
class FileWriter final : public IWriter {
  public:
    static Result Open(std::string path, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    Result Close();

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

// Writes `contents` to `path` through "<path>.tmp" + rename, so readers see
// either the old file or the complete new one.
Result WriteFileAtomically(const std::string& path, std::string_view contents);

} // namespace hotpush
