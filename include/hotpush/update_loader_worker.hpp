#pragma once

#include "hotpush/content_fetcher.hpp"
#include "hotpush/document_storage.hpp"
#include "hotpush/manifest_diff.hpp"
#include "hotpush/progress.hpp"
#include "hotpush/release_layout.hpp"
#include "hotpush/update_outcome.hpp"
#include "io/file_system.hpp"
#include "net/transport.hpp"

#include <expected>
#include <memory>
#include <string>

namespace hotpush {

struct UpdateRequest {
    std::string config_url;
    std::string content_root;
    std::string installed_release;
};

// One update check: loads the installed documents, fetches the remote ones,
// and stages changed files for the next launch. Run() never throws and always
// produces exactly one outcome tagged with this worker's id.
class UpdateLoaderWorker {
  public:
    struct Collaborators {
        std::shared_ptr<const ITransport> transport;
        std::shared_ptr<const IFileSystem> file_system;
        std::shared_ptr<const IDocumentStorage> storage;
        std::shared_ptr<const INativeVersionOracle> version_oracle;
    };

    UpdateLoaderWorker(UpdateRequest request, Collaborators collaborators);

    const std::string& WorkerId() const { return worker_id_; }

    void SetProgressSink(IProgress* sink) { progress_sink_ = sink; }
    void SetEventSink(IUpdateEventSink* sink) { event_sink_ = sink; }

    UpdateOutcome Run();

  private:
    struct InstalledDocuments {
        ApplicationConfig config;
        ContentManifest manifest;
    };

    UpdateOutcome Execute();
    std::expected<InstalledDocuments, UpdateOutcome> LoadInstalled(const ReleaseFileLayout& layout) const;
    UpdateOutcome StageRelease(ReleaseFileLayout& layout,
                               const ApplicationConfig& new_config,
                               const ContentManifest& new_manifest,
                               const ManifestDiff& diff) const;
    UpdateOutcome RefreshInstalledDocuments(const ReleaseFileLayout& layout,
                                            const ContentManifest& installed_manifest,
                                            const ApplicationConfig& new_config,
                                            const ContentManifest& new_manifest) const;

    UpdateOutcome Fail(UpdateErrorKind kind,
                       const ApplicationConfig* config,
                       std::string detail) const;
    UpdateOutcome Nothing(const ApplicationConfig& config) const;
    UpdateOutcome Ready(const ApplicationConfig& config) const;

    static std::string GenerateId();

    std::string worker_id_;
    UpdateRequest request_;
    Collaborators collaborators_;
    IProgress* progress_sink_ = nullptr;
    IUpdateEventSink* event_sink_ = nullptr;
};

} // namespace hotpush
