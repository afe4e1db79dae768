#pragma once

#include "util/app_config.hpp"

#include <optional>
#include <string>
#include <variant>

namespace hotpush {

enum class UpdateErrorKind : int {
    FailedToDownloadApplicationConfig = -1,
    NativeVersionTooLow = -2,
    FailedToDownloadContentManifest = -3,
    FailedToDownloadUpdateFiles = -4,
    LocalConfigNotFound = -6,
    LocalManifestNotFound = -7,
};

const char* ToString(UpdateErrorKind kind);

struct UpdateError {
    UpdateErrorKind kind;
    std::optional<ApplicationConfig> config;
    std::string detail;
};

struct NothingToUpdate {
    ApplicationConfig config;
};

struct ReadyToInstall {
    ApplicationConfig config;
};

using UpdateResult = std::variant<UpdateError, NothingToUpdate, ReadyToInstall>;

// Terminal result of one update run.
struct UpdateOutcome {
    std::string worker_id;
    UpdateResult result;

    bool IsError() const { return std::holds_alternative<UpdateError>(result); }
    bool IsNothingToUpdate() const { return std::holds_alternative<NothingToUpdate>(result); }
    bool IsReadyToInstall() const { return std::holds_alternative<ReadyToInstall>(result); }

    const UpdateError* Error() const { return std::get_if<UpdateError>(&result); }

    // Remote config the outcome refers to, if the run got that far.
    const ApplicationConfig* Config() const;

    // "error", "nothing_to_update" or "ready_to_install".
    const char* Name() const;
};

class IUpdateEventSink {
  public:
    virtual ~IUpdateEventSink() = default;
    virtual void OnUpdateOutcome(const UpdateOutcome& outcome) = 0;
};

class INativeVersionOracle {
  public:
    virtual ~INativeVersionOracle() = default;
    virtual int CurrentBuildVersion() const = 0;
};

class FixedNativeVersion final : public INativeVersionOracle {
  public:
    explicit FixedNativeVersion(int build_version) : build_version_(build_version) {}
    int CurrentBuildVersion() const override { return build_version_; }

  private:
    int build_version_ = 0;
};

} // namespace hotpush
