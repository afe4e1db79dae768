#pragma once

#include <string>
#include <string_view>

namespace hotpush {

// Joins a base URL and a relative path with exactly one '/' between them.
// An empty relative part returns the base unchanged.
inline std::string JoinUrl(std::string_view base, std::string_view relative) {
    while (!relative.empty() && relative.front() == '/') relative.remove_prefix(1);
    if (relative.empty()) return std::string(base);

    std::string out(base);
    while (!out.empty() && out.back() == '/') out.pop_back();
    out.push_back('/');
    out.append(relative);
    return out;
}

} // namespace hotpush
