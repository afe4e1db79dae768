#include "hotpush/update_outcome.hpp"

#include <type_traits>

namespace hotpush {

const char* ToString(UpdateErrorKind kind) {
    switch (kind) {
        case UpdateErrorKind::FailedToDownloadApplicationConfig:
            return "failed to download application config";
        case UpdateErrorKind::NativeVersionTooLow:
            return "native version too low for the new release";
        case UpdateErrorKind::FailedToDownloadContentManifest:
            return "failed to download content manifest";
        case UpdateErrorKind::FailedToDownloadUpdateFiles:
            return "failed to download update files";
        case UpdateErrorKind::LocalConfigNotFound:
            return "local application config not found";
        case UpdateErrorKind::LocalManifestNotFound:
            return "local content manifest not found";
    }
    return "unknown error";
}

const ApplicationConfig* UpdateOutcome::Config() const {
    return std::visit(
        [](const auto& r) -> const ApplicationConfig* {
            if constexpr (std::is_same_v<std::decay_t<decltype(r)>, UpdateError>) {
                return r.config ? &*r.config : nullptr;
            } else {
                return &r.config;
            }
        },
        result);
}

const char* UpdateOutcome::Name() const {
    if (IsError())
        return "error";
    if (IsNothingToUpdate())
        return "nothing_to_update";
    return "ready_to_install";
}

} // namespace hotpush
