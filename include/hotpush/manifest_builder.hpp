#pragma once

#include "util/content_manifest.hpp"

#include <expected>
#include <string>

namespace hotpush {

class ManifestBuilder {
  public:
    // Lists every regular file below `dir` with its SHA-256 as fingerprint,
    // sorted by path. chcp.json and chcp.manifest at the top level are skipped.
    static std::expected<ContentManifest, std::string> BuildFromDirectory(const std::string& dir);
};

} // namespace hotpush
