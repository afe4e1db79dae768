#include "hotpush/release_layout.hpp"

#include "hotpush/content_path_policy.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>

namespace hotpush {

namespace {
constexpr const char kInstalledSubfolder[] = "www";
constexpr const char kStagingSubfolder[] = "update";
constexpr const char kTempSubfolder[] = "tmp";
} // namespace

ReleaseFileLayout::ReleaseFileLayout(std::string root_folder, std::string installed_release)
    : ReleaseFileLayout(std::move(root_folder), std::move(installed_release), nullptr) {}

ReleaseFileLayout::ReleaseFileLayout(std::string root_folder,
                                     std::string installed_release,
                                     std::shared_ptr<const IFileSystem> file_system)
    : file_system_(file_system ? std::move(file_system) : DefaultFileSystem()),
      root_folder_(std::move(root_folder)), installed_release_(std::move(installed_release)) {
    installed_folder_ = JoinPath(ReleaseFolder(installed_release_), kInstalledSubfolder);
}

std::string ReleaseFileLayout::ReleaseFolder(const std::string& release) const {
    return JoinPath(root_folder_, release);
}

InstalledPaths ReleaseFileLayout::ResolveInstalledPaths() const {
    return InstalledPaths{
        .config_path = JoinPath(installed_folder_, kConfigFileName),
        .manifest_path = JoinPath(installed_folder_, kManifestFileName),
        .content_root = installed_folder_,
    };
}

Result ReleaseFileLayout::SwitchToRelease(const std::string& release) {
    if (!ContentPathPolicy::IsSafeReleaseToken(release)) {
        return Result::Fail(EINVAL, "release token is not a safe folder name: " + release);
    }
    if (release == installed_release_) {
        return Result::Fail(EINVAL, "cannot stage over the installed release: " + release);
    }

    staging_release_ = release;
    staging_content_folder_ = ReleaseFolder(release);
    staging_folder_ = JoinPath(staging_content_folder_, kStagingSubfolder);
    temp_folder_ = JoinPath(staging_content_folder_, kTempSubfolder);
    return Result::Ok();
}

Result ReleaseFileLayout::RecreateFolder(const std::string& path) const {
    if (path.empty())
        return Result::Fail(EINVAL, "recreate folder: empty path");

    auto del = file_system_->Delete(path);
    if (!del.is_ok())
        return del;
    return file_system_->EnsureDirectoryExists(path);
}

Result ReleaseFileLayout::DeleteFolder(const std::string& path) const {
    if (path.empty())
        return Result::Ok();
    return file_system_->Delete(path);
}

Result ReleaseFileLayout::DiscardStagedRelease() const {
    if (staging_content_folder_.empty())
        return Result::Ok();
    LogDebug("Discarding staged release folder %s", staging_content_folder_.c_str());
    return file_system_->Delete(staging_content_folder_);
}

} // namespace hotpush
