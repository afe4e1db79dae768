#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace hotpush::config {

// Updater settings read from a JSON object file. Every field is optional;
// command-line options override whatever the file provides.
class UpdaterConfigFromFile {
public:
    std::string config_url;
    std::string content_root;
    std::string installed_release;

    std::optional<std::uint64_t> native_build_version;
    std::optional<std::uint64_t> timeout_ms;
    std::optional<bool> progress;
    std::optional<std::string> log_level;

    bool LoadFile(const std::string &path);

    void Reset();
};

} // namespace hotpush::config
