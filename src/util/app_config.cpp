#include "util/app_config.hpp"

namespace hotpush {

const char* ToString(UpdatePhase phase) {
    switch (phase) {
        case UpdatePhase::OnStart:  return "start";
        case UpdatePhase::OnResume: return "resume";
        case UpdatePhase::Now:      return "now";
    }
    return "resume";
}

} // namespace hotpush
