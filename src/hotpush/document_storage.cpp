#include "hotpush/document_storage.hpp"

#include "hotpush/release_layout.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "util/document_parser.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>

namespace hotpush {

namespace {

std::optional<std::string> ReadDocument(const std::string& path) {
    FileReader reader;
    auto open_res = FileReader::Open(path, reader);
    if (!open_res.is_ok()) {
        if (open_res.code() != ENOENT) {
            LogWarn("%s", open_res.message().c_str());
        }
        return std::nullopt;
    }

    std::string text;
    auto read_res = reader.ReadToString(text);
    if (!read_res.is_ok()) {
        LogWarn("%s", read_res.message().c_str());
        return std::nullopt;
    }
    return text;
}

} // namespace

std::optional<ApplicationConfig> FileDocumentStorage::LoadApplicationConfig(
    const std::string& folder) const {
    const std::string path = JoinPath(folder, ReleaseFileLayout::kConfigFileName);
    auto text = ReadDocument(path);
    if (!text)
        return std::nullopt;

    auto parsed = DocumentParser::ParseApplicationConfig(*text);
    if (!parsed) {
        LogWarn("Invalid application config %s: %s", path.c_str(), parsed.error().c_str());
        return std::nullopt;
    }
    return std::move(*parsed);
}

std::optional<ContentManifest> FileDocumentStorage::LoadContentManifest(
    const std::string& folder) const {
    const std::string path = JoinPath(folder, ReleaseFileLayout::kManifestFileName);
    auto text = ReadDocument(path);
    if (!text)
        return std::nullopt;

    auto parsed = DocumentParser::ParseContentManifest(*text);
    if (!parsed) {
        LogWarn("Invalid content manifest %s: %s", path.c_str(), parsed.error().c_str());
        return std::nullopt;
    }
    return std::move(*parsed);
}

Result FileDocumentStorage::StoreApplicationConfig(const ApplicationConfig& config,
                                                   const std::string& folder) const {
    const std::string path = JoinPath(folder, ReleaseFileLayout::kConfigFileName);
    return WriteFileAtomically(path, DocumentParser::Serialize(config));
}

Result FileDocumentStorage::StoreContentManifest(const ContentManifest& manifest,
                                                 const std::string& folder) const {
    const std::string path = JoinPath(folder, ReleaseFileLayout::kManifestFileName);
    return WriteFileAtomically(path, DocumentParser::Serialize(manifest));
}

} // namespace hotpush
