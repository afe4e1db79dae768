#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace hotpush {

class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader &out);

    ssize_t Read(std::span<std::uint8_t> out) override;

    // Reads the remaining bytes of the file into `out`.
    Result ReadToString(std::string &out);

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

} // namespace hotpush
