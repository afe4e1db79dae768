#pragma once

#include "util/result.hpp"

#include <expected>
#include <string>

namespace hotpush {

// Byte transfer for the update pipeline. Timeouts and retries are the
// implementation's business; callers only see success or failure.
class ITransport {
  public:
    virtual ~ITransport() = default;

    // Downloads the resource into memory.
    virtual std::expected<std::string, std::string> Fetch(const std::string& url) const = 0;

    // Downloads the resource into `dest_path`, creating or truncating it.
    // On failure `dest_path` may be left behind; callers own its cleanup.
    virtual Result FetchFile(const std::string& url, const std::string& dest_path) const = 0;
};

} // namespace hotpush
