#pragma once

#include "io/file_system.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>

namespace hotpush {

struct InstalledPaths {
    std::string config_path;
    std::string manifest_path;
    std::string content_root;
};

// Paths of one content root:
//   <root>/<installed-release>/www       installed, serving release
//   <root>/<staging-release>/update      download in progress
//   <root>/<staging-release>/tmp         partial files of the current run
class ReleaseFileLayout {
  public:
    static constexpr const char kConfigFileName[] = "chcp.json";
    static constexpr const char kManifestFileName[] = "chcp.manifest";

    ReleaseFileLayout(std::string root_folder, std::string installed_release);
    ReleaseFileLayout(std::string root_folder,
                      std::string installed_release,
                      std::shared_ptr<const IFileSystem> file_system);

    InstalledPaths ResolveInstalledPaths() const;
    const std::string& InstalledFolder() const { return installed_folder_; }
    const std::string& InstalledRelease() const { return installed_release_; }

    // Rebinds the staging and temp folders to `release`. No I/O.
    Result SwitchToRelease(const std::string& release);

    const std::string& StagingRelease() const { return staging_release_; }
    const std::string& StagingContentFolder() const { return staging_content_folder_; }
    const std::string& StagingFolder() const { return staging_folder_; }
    const std::string& TempFolder() const { return temp_folder_; }

    // Deletes `path` if present, then creates it empty.
    Result RecreateFolder(const std::string& path) const;

    Result DeleteFolder(const std::string& path) const;

    // Removes everything the current staging release put on disk.
    Result DiscardStagedRelease() const;

  private:
    std::string ReleaseFolder(const std::string& release) const;

    std::shared_ptr<const IFileSystem> file_system_;
    std::string root_folder_;
    std::string installed_release_;
    std::string installed_folder_;

    std::string staging_release_;
    std::string staging_content_folder_;
    std::string staging_folder_;
    std::string temp_folder_;
};

} // namespace hotpush
