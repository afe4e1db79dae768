#pragma once

#include <string>

namespace hotpush {

// When the host should activate a staged release.
enum class UpdatePhase {
    OnStart,
    OnResume,
    Now,
};

const char* ToString(UpdatePhase phase);

struct ApplicationConfig {
    std::string release_version;
    int minimum_native_version = 0;
    std::string content_url;
    UpdatePhase update_phase = UpdatePhase::OnResume;

    // Document text as received; written back verbatim when storing.
    std::string raw_json;
};

} // namespace hotpush
