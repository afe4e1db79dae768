#pragma once

#include "hotpush/update_outcome.hpp"
#include "net/transport.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/hotpush_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
};

inline bool WriteTextFile(const std::string& path, const std::string& content) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os.good()) {
        return false;
    }
    os << content;
    return os.good();
}

inline std::string ReadTextFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
}

inline bool Exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

inline std::string ConfigJson(const std::string& release,
                              const std::string& content_url,
                              int min_native = 1) {
    return "{\"release\":\"" + release + "\",\"content_url\":\"" + content_url +
           "\",\"min_native_interface\":" + std::to_string(min_native) + "}";
}

inline std::string ManifestJson(const std::vector<std::pair<std::string, std::string>>& files) {
    std::string out = "[";
    for (size_t i = 0; i < files.size(); ++i) {
        if (i > 0)
            out += ",";
        out += "{\"file\":\"" + files[i].first + "\",\"hash\":\"" + files[i].second + "\"}";
    }
    return out + "]";
}

// In-memory transport: serves registered URLs, fails the ones marked broken,
// and records every request.
class FakeTransport final : public hotpush::ITransport {
  public:
    void Serve(const std::string& url, const std::string& body) {
        std::lock_guard<std::mutex> lk(mu_);
        resources_[url] = body;
    }

    void Break(const std::string& url) {
        std::lock_guard<std::mutex> lk(mu_);
        broken_.insert(url);
    }

    std::vector<std::string> Requests() const {
        std::lock_guard<std::mutex> lk(mu_);
        return requests_;
    }

    bool WasRequested(const std::string& url) const {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& r : requests_) {
            if (r == url)
                return true;
        }
        return false;
    }

    size_t FileRequestCount() const {
        std::lock_guard<std::mutex> lk(mu_);
        return file_requests_;
    }

    std::expected<std::string, std::string> Fetch(const std::string& url) const override {
        std::lock_guard<std::mutex> lk(mu_);
        requests_.push_back(url);
        if (broken_.contains(url))
            return std::unexpected("connection reset: " + url);
        auto it = resources_.find(url);
        if (it == resources_.end())
            return std::unexpected("http 404: " + url);
        return it->second;
    }

    hotpush::Result FetchFile(const std::string& url, const std::string& dest_path) const override {
        std::string body;
        {
            std::lock_guard<std::mutex> lk(mu_);
            requests_.push_back(url);
            ++file_requests_;
            if (broken_.contains(url)) {
                // Leave a truncated file behind like an interrupted transfer would.
                WriteTextFile(dest_path, "partial");
                return hotpush::Result::Fail(-1, "connection reset: " + url);
            }
            auto it = resources_.find(url);
            if (it == resources_.end())
                return hotpush::Result::Fail(-1, "http 404: " + url);
            body = it->second;
        }
        if (!WriteTextFile(dest_path, body))
            return hotpush::Result::Fail(-1, "cannot write " + dest_path);
        return hotpush::Result::Ok();
    }

  private:
    mutable std::mutex mu_;
    std::map<std::string, std::string> resources_;
    std::set<std::string> broken_;
    mutable std::vector<std::string> requests_;
    mutable size_t file_requests_ = 0;
};

class RecordingSink final : public hotpush::IUpdateEventSink {
  public:
    void OnUpdateOutcome(const hotpush::UpdateOutcome& outcome) override {
        std::lock_guard<std::mutex> lk(mu_);
        outcomes_.push_back(outcome);
    }

    std::vector<hotpush::UpdateOutcome> Outcomes() const {
        std::lock_guard<std::mutex> lk(mu_);
        return outcomes_;
    }

  private:
    mutable std::mutex mu_;
    std::vector<hotpush::UpdateOutcome> outcomes_;
};

} // namespace testutil
