#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace hotpush {

// Turns manifest file paths into relative paths that stay inside the
// destination folder.
class ContentPathPolicy {
  public:
    Result NormalizeManifestPath(std::string_view raw_path, std::string& out_relative) const;

    // Release tokens become directory names: no separators, no dot segments.
    static bool IsSafeReleaseToken(std::string_view token);

  private:
    static bool IsSafeRelativePath(const std::string& p);
};

} // namespace hotpush
