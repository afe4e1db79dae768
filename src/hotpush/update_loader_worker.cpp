#include "hotpush/update_loader_worker.hpp"

#include "hotpush/content_path_policy.hpp"
#include "net/curl_transport.hpp"
#include "util/logger.hpp"

#include <atomic>
#include <chrono>
#include <utility>

namespace hotpush {

UpdateLoaderWorker::UpdateLoaderWorker(UpdateRequest request, Collaborators collaborators)
    : worker_id_(GenerateId()), request_(std::move(request)),
      collaborators_(std::move(collaborators)) {
    if (!collaborators_.transport)
        collaborators_.transport = std::make_shared<CurlTransport>();
    if (!collaborators_.file_system)
        collaborators_.file_system = DefaultFileSystem();
    if (!collaborators_.storage)
        collaborators_.storage = std::make_shared<FileDocumentStorage>();
    if (!collaborators_.version_oracle)
        LogWarn("No native version oracle, native build is taken as 0");
}

std::string UpdateLoaderWorker::GenerateId() {
    static std::atomic<std::uint64_t> seq{0};
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::system_clock::now().time_since_epoch())
                        .count();
    return std::to_string(ms) + "-" + std::to_string(seq.fetch_add(1) + 1);
}

UpdateOutcome UpdateLoaderWorker::Run() {
    LogInfo("Starting loader worker %s", worker_id_.c_str());

    UpdateOutcome outcome = Execute();

    if (const UpdateError* err = outcome.Error()) {
        LogError("Loader worker %s failed: %s (%d) %s",
                 worker_id_.c_str(),
                 ToString(err->kind),
                 static_cast<int>(err->kind),
                 err->detail.c_str());
    } else {
        LogInfo("Loader worker %s has finished: %s release=%s",
                worker_id_.c_str(),
                outcome.Name(),
                outcome.Config()->release_version.c_str());
    }

    if (event_sink_)
        event_sink_->OnUpdateOutcome(outcome);
    return outcome;
}

std::expected<UpdateLoaderWorker::InstalledDocuments, UpdateOutcome>
UpdateLoaderWorker::LoadInstalled(const ReleaseFileLayout& layout) const {
    const std::string& folder = layout.InstalledFolder();

    auto config = collaborators_.storage->LoadApplicationConfig(folder);
    if (!config) {
        return std::unexpected(
            Fail(UpdateErrorKind::LocalConfigNotFound, nullptr, "no application config in " + folder));
    }

    auto manifest = collaborators_.storage->LoadContentManifest(folder);
    if (!manifest) {
        return std::unexpected(
            Fail(UpdateErrorKind::LocalManifestNotFound, nullptr, "no content manifest in " + folder));
    }

    return InstalledDocuments{.config = std::move(*config), .manifest = std::move(*manifest)};
}

UpdateOutcome UpdateLoaderWorker::Execute() {
    if (!ContentPathPolicy::IsSafeReleaseToken(request_.installed_release)) {
        return Fail(UpdateErrorKind::LocalConfigNotFound, nullptr,
                    "installed release is not a safe folder name: " + request_.installed_release);
    }

    ReleaseFileLayout layout(request_.content_root, request_.installed_release,
                             collaborators_.file_system);

    auto installed = LoadInstalled(layout);
    if (!installed)
        return std::move(installed.error());

    ContentFetcher fetcher(collaborators_.transport, collaborators_.file_system);

    auto new_config = fetcher.FetchApplicationConfig(request_.config_url);
    if (!new_config) {
        return Fail(UpdateErrorKind::FailedToDownloadApplicationConfig, nullptr, new_config.error());
    }

    if (new_config->release_version == installed->config.release_version) {
        LogInfo("Release %s is already installed", new_config->release_version.c_str());
        return Nothing(*new_config);
    }

    const int build_version = collaborators_.version_oracle
                                  ? collaborators_.version_oracle->CurrentBuildVersion()
                                  : 0;
    if (new_config->minimum_native_version > build_version) {
        return Fail(UpdateErrorKind::NativeVersionTooLow,
                    &*new_config,
                    "release " + new_config->release_version + " needs native build " +
                        std::to_string(new_config->minimum_native_version) + ", have " +
                        std::to_string(build_version));
    }

    auto new_manifest =
        fetcher.FetchContentManifest(new_config->content_url, ReleaseFileLayout::kManifestFileName);
    if (!new_manifest) {
        return Fail(UpdateErrorKind::FailedToDownloadContentManifest, &*new_config,
                    new_manifest.error());
    }

    const ManifestDiff diff = ManifestDiffEngine::Diff(installed->manifest, *new_manifest);
    LogInfo("Manifest diff: added=%zu updated=%zu removed=%zu",
            diff.added.size(), diff.updated.size(), diff.removed.size());

    if (diff.IsEmpty()) {
        return RefreshInstalledDocuments(layout, installed->manifest, *new_config, *new_manifest);
    }

    return StageRelease(layout, *new_config, *new_manifest, diff);
}

// No content changed: only the documents are rewritten, in place. Both are
// rewritten or, on failure, the installed manifest is put back.
UpdateOutcome UpdateLoaderWorker::RefreshInstalledDocuments(
    const ReleaseFileLayout& layout,
    const ContentManifest& installed_manifest,
    const ApplicationConfig& new_config,
    const ContentManifest& new_manifest) const {
    const std::string& folder = layout.InstalledFolder();

    auto res = collaborators_.storage->StoreContentManifest(new_manifest, folder);
    if (!res.is_ok()) {
        return Fail(UpdateErrorKind::FailedToDownloadUpdateFiles, &new_config,
                    "refreshing installed documents: " + res.message());
    }

    res = collaborators_.storage->StoreApplicationConfig(new_config, folder);
    if (!res.is_ok()) {
        auto restored = collaborators_.storage->StoreContentManifest(installed_manifest, folder);
        if (!restored.is_ok()) {
            LogError("Could not restore installed manifest in %s: %s",
                     folder.c_str(), restored.message().c_str());
        }
        return Fail(UpdateErrorKind::FailedToDownloadUpdateFiles, &new_config,
                    "refreshing installed documents: " + res.message());
    }
    return Nothing(new_config);
}

UpdateOutcome UpdateLoaderWorker::StageRelease(ReleaseFileLayout& layout,
                                               const ApplicationConfig& new_config,
                                               const ContentManifest& new_manifest,
                                               const ManifestDiff& diff) const {
    auto failed = [&](const std::string& what, const Result& res) {
        auto cleanup = layout.DiscardStagedRelease();
        if (!cleanup.is_ok()) {
            LogWarn("Cleanup of staged release failed: %s", cleanup.message().c_str());
        }
        return Fail(UpdateErrorKind::FailedToDownloadUpdateFiles, &new_config,
                    what + ": " + res.message());
    };

    auto switched = layout.SwitchToRelease(new_config.release_version);
    if (!switched.is_ok()) {
        return Fail(UpdateErrorKind::FailedToDownloadUpdateFiles, &new_config, switched.message());
    }

    auto res = layout.RecreateFolder(layout.StagingFolder());
    if (!res.is_ok())
        return failed("preparing staging folder", res);
    res = layout.RecreateFolder(layout.TempFolder());
    if (!res.is_ok())
        return failed("preparing temp folder", res);

    ContentFetcher fetcher(collaborators_.transport, collaborators_.file_system);
    fetcher.SetProgressSink(progress_sink_);

    res = fetcher.FetchFiles(layout.StagingFolder(), new_config.content_url, diff.UpdateFiles(),
                             layout.TempFolder());
    if (!res.is_ok())
        return failed("downloading files", res);

    res = collaborators_.storage->StoreContentManifest(new_manifest, layout.StagingFolder());
    if (res.is_ok())
        res = collaborators_.storage->StoreApplicationConfig(new_config, layout.StagingFolder());
    if (!res.is_ok())
        return failed("storing documents", res);

    res = layout.DeleteFolder(layout.TempFolder());
    if (!res.is_ok()) {
        LogWarn("Could not remove temp folder: %s", res.message().c_str());
    }

    LogInfo("Release %s staged in %s",
            new_config.release_version.c_str(),
            layout.StagingFolder().c_str());
    return Ready(new_config);
}

UpdateOutcome UpdateLoaderWorker::Fail(UpdateErrorKind kind,
                                       const ApplicationConfig* config,
                                       std::string detail) const {
    UpdateError err{.kind = kind, .config = std::nullopt, .detail = std::move(detail)};
    if (config)
        err.config = *config;
    return UpdateOutcome{.worker_id = worker_id_, .result = std::move(err)};
}

UpdateOutcome UpdateLoaderWorker::Nothing(const ApplicationConfig& config) const {
    return UpdateOutcome{.worker_id = worker_id_, .result = NothingToUpdate{config}};
}

UpdateOutcome UpdateLoaderWorker::Ready(const ApplicationConfig& config) const {
    return UpdateOutcome{.worker_id = worker_id_, .result = ReadyToInstall{config}};
}

} // namespace hotpush
