#include "util/config_json_utils.hpp"

#include "util/logger.hpp"

#include <fstream>

namespace hotpush::config::detail {

namespace {

// Present but wrongly typed values are reported through `err`; absent keys are not errors.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v < 0) {
        err = std::string(key) + " must not be negative";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, UpdaterConfigFromFile& cfg, std::string& err) {
    err.clear();

    GetStringIfPresent(j, "ConfigUrl", cfg.config_url, err);
    GetStringIfPresent(j, "ContentRoot", cfg.content_root, err);
    GetStringIfPresent(j, "InstalledRelease", cfg.installed_release, err);
    if (!err.empty())
        return false;

    {
        std::uint64_t v{};
        if (GetU64IfPresent(j, "NativeBuildVersion", v, err)) {
            cfg.native_build_version = v;
        }
        if (GetU64IfPresent(j, "TimeoutMs", v, err)) {
            cfg.timeout_ms = v;
        }
    }
    {
        bool b{};
        if (GetBoolIfPresent(j, "Progress", b, err)) {
            cfg.progress = b;
        }
    }
    {
        std::string level;
        if (GetStringIfPresent(j, "LogLevel", level, err)) {
            LogLevel parsed{};
            if (!ParseLogLevel(level, parsed)) {
                err = "unknown LogLevel: " + level;
                return false;
            }
            cfg.log_level = level;
        }
    }

    return err.empty();
}

} // namespace hotpush::config::detail
