#include "util/document_parser.hpp"

#include "util/path_utils.hpp"

#include <limits>
#include <nlohmann/json.hpp>
#include <unordered_set>

namespace hotpush {

using json = nlohmann::json;

namespace {

bool IsBlank(const std::string& s) {
    return s.find_first_not_of(" \t\n\r") == std::string::npos;
}

std::expected<UpdatePhase, std::string> ParseUpdatePhase(const std::string& s) {
    if (s == "start")
        return UpdatePhase::OnStart;
    if (s == "resume")
        return UpdatePhase::OnResume;
    if (s == "now")
        return UpdatePhase::Now;
    return std::unexpected("unknown update phase: " + s);
}

} // namespace

std::expected<ApplicationConfig, std::string>
DocumentParser::ParseApplicationConfig(const std::string& json_input) {
    try {
        if (IsBlank(json_input)) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        ApplicationConfig cfg;
        cfg.release_version = j.value("release", "");
        if (cfg.release_version.empty()) {
            return std::unexpected("missing release");
        }

        const auto min_native = j.value("min_native_interface", 0LL);
        if (min_native < 0) {
            return std::unexpected("min_native_interface must not be negative");
        }
        if (min_native > std::numeric_limits<int>::max()) {
            return std::unexpected("min_native_interface out of range");
        }
        cfg.minimum_native_version = static_cast<int>(min_native);
        cfg.content_url = j.value("content_url", "");

        auto phase = ParseUpdatePhase(j.value("update", "resume"));
        if (!phase)
            return std::unexpected(phase.error());
        cfg.update_phase = *phase;

        cfg.raw_json = json_input;
        return cfg;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

std::expected<ContentManifest, std::string>
DocumentParser::ParseContentManifest(const std::string& json_input) {
    try {
        if (IsBlank(json_input)) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_array()) {
            return std::unexpected("JSON root must be an array");
        }

        ContentManifest m;
        m.files.reserve(j.size());
        std::unordered_set<std::string> seen;

        for (const auto& item : j) {
            if (!item.is_object()) {
                return std::unexpected("manifest entry must be an object");
            }
            ManifestFile f;
            f.path = item.value("file", "");
            f.fingerprint = item.value("hash", "");
            if (f.path.empty()) {
                return std::unexpected("manifest entry missing file");
            }
            if (f.fingerprint.empty()) {
                return std::unexpected("manifest entry missing hash: " + f.path);
            }
            // "a.js" and "./a.js" land on the same file.
            if (!seen.insert(NormalizeContentPath(f.path)).second) {
                return std::unexpected("duplicate manifest entry: " + f.path);
            }
            m.files.push_back(std::move(f));
        }

        m.raw_json = json_input;
        return m;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

std::string DocumentParser::Serialize(const ApplicationConfig& config) {
    if (!config.raw_json.empty())
        return config.raw_json;

    json j = {
        {"release", config.release_version},
        {"min_native_interface", config.minimum_native_version},
        {"content_url", config.content_url},
        {"update", ToString(config.update_phase)},
    };
    return j.dump(2);
}

std::string DocumentParser::Serialize(const ContentManifest& manifest) {
    if (!manifest.raw_json.empty())
        return manifest.raw_json;

    json arr = json::array();
    for (const auto& f : manifest.files) {
        arr.push_back({{"file", f.path}, {"hash", f.fingerprint}});
    }
    return arr.dump(2);
}

} // namespace hotpush
