#pragma once

#include "util/app_config.hpp"
#include "util/content_manifest.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>

namespace hotpush {

// Loads and stores the two version documents of a release folder.
// Load returns nullopt when the document is missing or unreadable.
class IDocumentStorage {
  public:
    virtual ~IDocumentStorage() = default;

    virtual std::optional<ApplicationConfig> LoadApplicationConfig(const std::string& folder) const = 0;
    virtual std::optional<ContentManifest> LoadContentManifest(const std::string& folder) const = 0;

    virtual Result StoreApplicationConfig(const ApplicationConfig& config,
                                          const std::string& folder) const = 0;
    virtual Result StoreContentManifest(const ContentManifest& manifest,
                                        const std::string& folder) const = 0;
};

// chcp.json / chcp.manifest files inside the folder.
class FileDocumentStorage final : public IDocumentStorage {
  public:
    std::optional<ApplicationConfig> LoadApplicationConfig(const std::string& folder) const override;
    std::optional<ContentManifest> LoadContentManifest(const std::string& folder) const override;

    Result StoreApplicationConfig(const ApplicationConfig& config,
                                  const std::string& folder) const override;
    Result StoreContentManifest(const ContentManifest& manifest,
                                const std::string& folder) const override;
};

} // namespace hotpush
