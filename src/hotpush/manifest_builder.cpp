#include "hotpush/manifest_builder.hpp"

#include "crypto/sha256.hpp"
#include "hotpush/release_layout.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace hotpush {

namespace {

bool IsDocumentFile(const std::string& relative) {
    return relative == ReleaseFileLayout::kConfigFileName ||
           relative == ReleaseFileLayout::kManifestFileName;
}

} // namespace

std::expected<ContentManifest, std::string> ManifestBuilder::BuildFromDirectory(
    const std::string& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return std::unexpected("not a directory: " + dir);
    }

    ContentManifest manifest;
    fs::recursive_directory_iterator it(dir, ec);
    if (ec) {
        return std::unexpected("cannot read " + dir + ": " + ec.message());
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return std::unexpected("cannot read " + dir + ": " + ec.message());
        }
        if (!it->is_regular_file(ec))
            continue;

        const std::string relative = it->path().lexically_relative(dir).generic_string();
        if (IsDocumentFile(relative))
            continue;

        std::string hash;
        auto res = Sha256HexFile(it->path().string(), hash);
        if (!res.is_ok()) {
            return std::unexpected(res.message());
        }
        LogDebug("manifest: %s %s", relative.c_str(), hash.c_str());
        manifest.files.push_back(ManifestFile{.path = relative, .fingerprint = hash});
    }
    if (ec) {
        return std::unexpected("cannot read " + dir + ": " + ec.message());
    }

    std::sort(manifest.files.begin(), manifest.files.end(),
              [](const ManifestFile& a, const ManifestFile& b) { return a.path < b.path; });
    return manifest;
}

} // namespace hotpush
