#pragma once

#include "net/transport.hpp"

#include <string>

namespace hotpush {

class CurlTransport final : public ITransport {
  public:
    struct Options {
        long timeout_ms = 0;              // 0 => no overall limit, low-speed abort instead
        long connect_timeout_ms = 15000;
        std::string user_agent = "hotpush/1.0";
    };

    CurlTransport();
    explicit CurlTransport(Options opt);

    std::expected<std::string, std::string> Fetch(const std::string& url) const override;
    Result FetchFile(const std::string& url, const std::string& dest_path) const override;

  private:
    Options opt_;
};

} // namespace hotpush
