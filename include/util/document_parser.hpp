#pragma once

#include "util/app_config.hpp"
#include "util/content_manifest.hpp"

#include <expected>
#include <string>

namespace hotpush {

class DocumentParser {
  public:
    static std::expected<ApplicationConfig, std::string>
    ParseApplicationConfig(const std::string& json_input);

    static std::expected<ContentManifest, std::string>
    ParseContentManifest(const std::string& json_input);

    // Returns raw_json when the document carries it, otherwise a fresh rendering.
    static std::string Serialize(const ApplicationConfig& config);
    static std::string Serialize(const ContentManifest& manifest);
};

} // namespace hotpush
