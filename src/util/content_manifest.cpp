#include "util/content_manifest.hpp"

namespace hotpush {

const ManifestFile* ContentManifest::Find(std::string_view path) const {
    for (const auto& f : files) {
        if (f.path == path)
            return &f;
    }
    return nullptr;
}

} // namespace hotpush
