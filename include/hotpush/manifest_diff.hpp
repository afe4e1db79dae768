#pragma once

#include "util/content_manifest.hpp"

#include <vector>

namespace hotpush {

// Files that differ between an installed manifest and a newer one.
// The three lists are disjoint.
struct ManifestDiff {
    std::vector<ManifestFile> added;
    std::vector<ManifestFile> updated;
    std::vector<ManifestFile> removed;

    bool IsEmpty() const { return added.empty() && updated.empty() && removed.empty(); }

    // Everything that has to be downloaded: added followed by updated.
    std::vector<ManifestFile> UpdateFiles() const;
};

class ManifestDiffEngine {
  public:
    // Compares by fingerprint only. Added and updated keep the order of
    // `new_manifest`, removed keeps the order of `old_manifest`.
    static ManifestDiff Diff(const ContentManifest& old_manifest,
                             const ContentManifest& new_manifest);
};

} // namespace hotpush
