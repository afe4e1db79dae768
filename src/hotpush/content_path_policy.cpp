#include "hotpush/content_path_policy.hpp"

#include "util/path_utils.hpp"

#include <cerrno>

namespace hotpush {

bool ContentPathPolicy::IsSafeRelativePath(const std::string& p) {
    if (p.empty()) return false;
    if (p.front() == '/') return false;
    if (p.find('\\') != std::string::npos) return false;
    if (p.find('\0') != std::string::npos) return false;

    std::string_view sv(p);
    while (!sv.empty()) {
        const auto pos = sv.find('/');
        const auto seg = sv.substr(0, pos);
        if (seg == ".." || seg == ".") return false;
        if (pos == std::string_view::npos) break;
        sv.remove_prefix(pos + 1);
    }
    return true;
}

Result ContentPathPolicy::NormalizeManifestPath(std::string_view raw_path,
                                                std::string& out_relative) const {
    out_relative = NormalizeContentPath(std::string(raw_path));
    if (out_relative.empty() || out_relative.back() == '/') {
        return Result::Fail(EINVAL, "Not a file path in manifest: " + std::string(raw_path));
    }
    if (!IsSafeRelativePath(out_relative)) {
        return Result::Fail(EINVAL, "Unsafe path in manifest: " + std::string(raw_path));
    }
    return Result::Ok();
}

bool ContentPathPolicy::IsSafeReleaseToken(std::string_view token) {
    if (token.empty() || token == "." || token == "..") return false;
    return token.find_first_of(std::string_view("/\\\0", 3)) == std::string_view::npos;
}

} // namespace hotpush
