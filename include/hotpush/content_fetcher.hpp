#pragma once

#include "hotpush/content_path_policy.hpp"
#include "hotpush/progress.hpp"
#include "io/file_system.hpp"
#include "net/transport.hpp"
#include "util/app_config.hpp"
#include "util/content_manifest.hpp"
#include "util/result.hpp"

#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace hotpush {

class ContentFetcher {
  public:
    ContentFetcher(std::shared_ptr<const ITransport> transport,
                   std::shared_ptr<const IFileSystem> file_system);

    void SetProgressSink(IProgress* sink) { progress_sink_ = sink; }

    std::expected<ApplicationConfig, std::string>
    FetchApplicationConfig(const std::string& url) const;

    std::expected<ContentManifest, std::string>
    FetchContentManifest(const std::string& base_content_url,
                         const std::string& manifest_file_name) const;

    // All-or-nothing: the first failing file aborts the batch and the error
    // names it. Files already moved into `dest_folder` stay there; the caller
    // discards the folder. Each file is downloaded into `temp_folder` (or next
    // to its destination when `temp_folder` is empty) and renamed into place.
    Result FetchFiles(const std::string& dest_folder,
                      const std::string& base_content_url,
                      const std::vector<ManifestFile>& files,
                      const std::string& temp_folder = {}) const;

  private:
    Result FetchOne(const std::string& dest_folder,
                    const std::string& base_content_url,
                    const ManifestFile& file,
                    const std::string& partial_path) const;

    std::shared_ptr<const ITransport> transport_;
    std::shared_ptr<const IFileSystem> file_system_;
    ContentPathPolicy path_policy_;
    IProgress* progress_sink_ = nullptr;
};

} // namespace hotpush
