#include "net/curl_transport.hpp"

#include "io/file_writer.hpp"
#include "util/logger.hpp"

#include <curl/curl.h>

#include <mutex>
#include <span>
#include <utility>

namespace hotpush {

namespace {

constexpr long kLowSpeedLimitBytesPerSec = 1;
constexpr long kLowSpeedTimeSeconds = 45;

bool EnsureCurlGlobalInit() {
    static std::once_flag init_flag;
    static bool init_ok = false;
    std::call_once(init_flag, []() {
        init_ok = (curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK);
    });
    return init_ok;
}

class CurlHandle final {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
    ~CurlHandle() {
        if (handle_) curl_easy_cleanup(handle_);
    }

    CURL* get() const { return handle_; }
    bool ok() const { return handle_ != nullptr; }

private:
    CURL* handle_ = nullptr;
};

struct FileSinkCtx {
    FileWriter* writer = nullptr;
    Result write_result = Result::Ok();
};

size_t WriteToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    const size_t count = size * nmemb;
    out->append(ptr, count);
    return count;
}

size_t WriteToFile(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<FileSinkCtx*>(userdata);
    const size_t count = size * nmemb;
    ctx->write_result = ctx->writer->WriteAll(
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(ptr), count));
    // Returning a short count makes curl abort with CURLE_WRITE_ERROR.
    return ctx->write_result.is_ok() ? count : 0;
}

void ApplyCommonOptions(CURL* h, const std::string& url, const CurlTransport::Options& opt) {
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, opt.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, opt.connect_timeout_ms);

    if (opt.timeout_ms > 0) {
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, opt.timeout_ms);
    } else {
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, kLowSpeedLimitBytesPerSec);
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, kLowSpeedTimeSeconds);
    }
}

// file:// transfers report response code 0.
bool IsSuccessfulResponse(long response_code) {
    return response_code == 0 || (response_code >= 200 && response_code < 300);
}

std::string DescribeFailure(CURLcode rc, long response_code, const std::string& url) {
    std::string msg = std::string(curl_easy_strerror(rc));
    if (response_code != 0) {
        msg += " (http " + std::to_string(response_code) + ")";
    }
    return msg + " url=" + url;
}

} // namespace

CurlTransport::CurlTransport() = default;

CurlTransport::CurlTransport(Options opt) : opt_(std::move(opt)) {}

std::expected<std::string, std::string> CurlTransport::Fetch(const std::string& url) const {
    if (!EnsureCurlGlobalInit())
        return std::unexpected("curl global init failed");

    CurlHandle h;
    if (!h.ok())
        return std::unexpected("curl_easy_init failed");

    std::string body;
    ApplyCommonOptions(h.get(), url, opt_);
    curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, WriteToString);
    curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &body);

    const CURLcode rc = curl_easy_perform(h.get());
    long response_code = 0;
    curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &response_code);

    if (rc != CURLE_OK || !IsSuccessfulResponse(response_code)) {
        const std::string msg = DescribeFailure(rc, response_code, url);
        LogDebug("Fetch failed: %s", msg.c_str());
        return std::unexpected(msg);
    }
    return body;
}

Result CurlTransport::FetchFile(const std::string& url, const std::string& dest_path) const {
    if (!EnsureCurlGlobalInit())
        return Result::Fail(-1, "curl global init failed");

    CurlHandle h;
    if (!h.ok())
        return Result::Fail(-1, "curl_easy_init failed");

    FileWriter writer;
    auto open_res = FileWriter::Open(dest_path, writer);
    if (!open_res.is_ok())
        return open_res;

    FileSinkCtx ctx;
    ctx.writer = &writer;

    ApplyCommonOptions(h.get(), url, opt_);
    curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, WriteToFile);
    curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &ctx);

    const CURLcode rc = curl_easy_perform(h.get());
    long response_code = 0;
    curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &response_code);

    if (!ctx.write_result.is_ok()) {
        return ctx.write_result;
    }
    if (rc != CURLE_OK || !IsSuccessfulResponse(response_code)) {
        const std::string msg = DescribeFailure(rc, response_code, url);
        LogDebug("FetchFile failed: %s", msg.c_str());
        return Result::Fail(-1, msg);
    }

    auto sync_res = writer.FsyncNow();
    if (!sync_res.is_ok())
        return sync_res;
    return writer.Close();
}

} // namespace hotpush
