#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"
#include "util/logger.hpp"

namespace hotpush::config {

void UpdaterConfigFromFile::Reset() {
    config_url.clear();
    content_root.clear();
    installed_release.clear();
    native_build_version.reset();
    timeout_ms.reset();
    progress.reset();
    log_level.reset();
}

bool UpdaterConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        LogWarn("Config: %s", err.c_str());
        return false;
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        LogError("Config: %s in %s", err.c_str(), path.c_str());
        Reset();
        return false;
    }

    return true;
}

} // namespace hotpush::config
