#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace hotpush {

struct ManifestFile {
    std::string path;
    std::string fingerprint;

    bool operator==(const ManifestFile&) const = default;
};

// Paths are unique; the parser rejects duplicates.
struct ContentManifest {
    std::vector<ManifestFile> files;
    std::string raw_json;

    const ManifestFile* Find(std::string_view path) const;
};

} // namespace hotpush
