#include "hotpush/manifest_diff.hpp"

#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace hotpush {

std::vector<ManifestFile> ManifestDiff::UpdateFiles() const {
    std::vector<ManifestFile> out;
    out.reserve(added.size() + updated.size());
    out.insert(out.end(), added.begin(), added.end());
    out.insert(out.end(), updated.begin(), updated.end());
    return out;
}

ManifestDiff ManifestDiffEngine::Diff(const ContentManifest& old_manifest,
                                      const ContentManifest& new_manifest) {
    std::unordered_map<std::string_view, std::string_view> old_by_path;
    old_by_path.reserve(old_manifest.files.size());
    for (const auto& f : old_manifest.files) {
        old_by_path.emplace(f.path, f.fingerprint);
    }

    ManifestDiff diff;
    std::unordered_set<std::string_view> new_paths;
    new_paths.reserve(new_manifest.files.size());

    for (const auto& f : new_manifest.files) {
        new_paths.insert(f.path);
        auto it = old_by_path.find(f.path);
        if (it == old_by_path.end()) {
            diff.added.push_back(f);
        } else if (it->second != f.fingerprint) {
            diff.updated.push_back(f);
        }
    }

    for (const auto& f : old_manifest.files) {
        if (!new_paths.contains(f.path)) {
            diff.removed.push_back(f);
        }
    }

    return diff;
}

} // namespace hotpush
