#include "hotpush/content_fetcher.hpp"

#include "util/document_parser.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/url_utils.hpp"

#include <filesystem>

namespace hotpush {

namespace {

std::string ParentOf(const std::string& path) {
    return std::filesystem::path(path).parent_path().string();
}

} // namespace

ContentFetcher::ContentFetcher(std::shared_ptr<const ITransport> transport,
                               std::shared_ptr<const IFileSystem> file_system)
    : transport_(std::move(transport)),
      file_system_(file_system ? std::move(file_system) : DefaultFileSystem()) {}

std::expected<ApplicationConfig, std::string>
ContentFetcher::FetchApplicationConfig(const std::string& url) const {
    if (url.empty())
        return std::unexpected("application config url is empty");

    auto body = transport_->Fetch(url);
    if (!body)
        return std::unexpected("download failed: " + body.error());

    auto parsed = DocumentParser::ParseApplicationConfig(*body);
    if (!parsed)
        return std::unexpected("invalid application config: " + parsed.error());
    return parsed;
}

std::expected<ContentManifest, std::string>
ContentFetcher::FetchContentManifest(const std::string& base_content_url,
                                     const std::string& manifest_file_name) const {
    if (base_content_url.empty())
        return std::unexpected("content url is not set in the application config");

    const std::string url = JoinUrl(base_content_url, manifest_file_name);
    auto body = transport_->Fetch(url);
    if (!body)
        return std::unexpected("download failed: " + body.error());

    auto parsed = DocumentParser::ParseContentManifest(*body);
    if (!parsed)
        return std::unexpected("invalid content manifest: " + parsed.error());
    return parsed;
}

Result ContentFetcher::FetchFiles(const std::string& dest_folder,
                                  const std::string& base_content_url,
                                  const std::vector<ManifestFile>& files,
                                  const std::string& temp_folder) const {
    if (base_content_url.empty())
        return Result::Fail(-1, "content url is not set in the application config");
    if (dest_folder.empty())
        return Result::Fail(-1, "destination folder is empty");

    LogInfo("Downloading %zu file(s) into %s", files.size(), dest_folder.c_str());

    std::uint64_t done = 0;
    for (const auto& file : files) {
        const std::string partial_path =
            temp_folder.empty() ? std::string()
                                : JoinPath(temp_folder, std::to_string(done) + ".part");

        auto res = FetchOne(dest_folder, base_content_url, file, partial_path);
        if (!res.is_ok()) {
            LogError("Failed to download %s: %s", file.path.c_str(), res.message().c_str());
            return Result::Wrap(res, "file '" + file.path + "'");
        }

        ++done;
        if (progress_sink_) {
            progress_sink_->OnProgress(ProgressEvent{
                .file = file.path,
                .files_done = done,
                .files_total = files.size(),
            });
        }
    }

    return Result::Ok();
}

Result ContentFetcher::FetchOne(const std::string& dest_folder,
                                const std::string& base_content_url,
                                const ManifestFile& file,
                                const std::string& partial_path) const {
    std::string relative;
    auto norm = path_policy_.NormalizeManifestPath(file.path, relative);
    if (!norm.is_ok())
        return norm;

    const std::string final_path = JoinPath(dest_folder, relative);
    const std::string download_path = partial_path.empty() ? final_path + ".part" : partial_path;
    const std::string url = JoinUrl(base_content_url, relative);

    auto mk = file_system_->EnsureDirectoryExists(ParentOf(final_path));
    if (!mk.is_ok())
        return mk;

    LogDebug("GET %s -> %s", url.c_str(), final_path.c_str());
    auto fetched = transport_->FetchFile(url, download_path);
    if (!fetched.is_ok()) {
        (void)file_system_->Delete(download_path);
        return fetched;
    }

    auto moved = file_system_->Rename(download_path, final_path);
    if (!moved.is_ok()) {
        (void)file_system_->Delete(download_path);
        return moved;
    }
    return Result::Ok();
}

} // namespace hotpush
