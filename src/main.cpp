#include "hotpush/manifest_builder.hpp"
#include "hotpush/progress_sinks.hpp"
#include "hotpush/update_loader_worker.hpp"
#include "io/file_writer.hpp"
#include "net/curl_transport.hpp"
#include "util/config_parser.hpp"
#include "util/document_parser.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace {

constexpr const char *kDefaultConfigPath = "/etc/hotpush/hotpush.conf";

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s -u <config-url> -r <content-root> -c <installed-release> -n <native-build>\n"
        "      [-t <timeout-ms>] [--progress] [-v]\n"
        "   %s -m <www-dir> [-o <file>]\n"
        "\n"
        "Options:\n"
        "  -u, --config-url       URL of the remote chcp.json\n"
        "  -r, --content-root     Folder holding the release folders\n"
        "  -c, --current          Installed release token\n"
        "  -n, --native-build     Native build number of the host application\n"
        "  -t, --timeout          Transfer timeout in milliseconds (0 = none)\n"
        "  -p, --progress         Show per-file download progress\n"
        "  -v, --verbose          Debug logging\n"
        "  -m, --build-manifest   Print a chcp.manifest for the given folder\n"
        "  -o, --output           Write the manifest to a file instead of stdout\n"
        "  -h, --help             Show this help\n"
        "\n"
        "Settings missing on the command line are read from %s\n"
        "(or $HOTPUSH_CONFIG_PATH).\n",
        argv, argv, kDefaultConfigPath);
}

bool ParseNonNegative(const char *text, std::uint64_t &out) {
    char *end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(text, &end, 10);
    if (!end || *end != '\0' || text[0] == '-' || errno == ERANGE) {
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

int BuildManifest(const std::string &dir, const char *output) {
    auto manifest = hotpush::ManifestBuilder::BuildFromDirectory(dir);
    if (!manifest) {
        std::fprintf(stderr, "ERROR: %s\n", manifest.error().c_str());
        return 1;
    }

    const std::string text = hotpush::DocumentParser::Serialize(*manifest) + "\n";
    if (!output) {
        std::fputs(text.c_str(), stdout);
        return 0;
    }

    auto res = hotpush::WriteFileAtomically(output, text);
    if (!res.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", res.message().c_str());
        return 1;
    }
    return 0;
}

void PrintOutcome(const hotpush::UpdateOutcome &outcome) {
    nlohmann::json j = {
        {"worker", outcome.worker_id},
        {"outcome", outcome.Name()},
    };
    if (const auto *cfg = outcome.Config()) {
        j["release"] = cfg->release_version;
        j["update"] = hotpush::ToString(cfg->update_phase);
    }
    if (const auto *err = outcome.Error()) {
        j["error_code"] = static_cast<int>(err->kind);
        j["error"] = hotpush::ToString(err->kind);
        j["detail"] = err->detail;
    }
    std::printf("%s\n", j.dump().c_str());
}

} // namespace

int main(int argc, char **argv) {
    const char *config_url = nullptr;
    const char *content_root = nullptr;
    const char *current = nullptr;
    const char *manifest_dir = nullptr;
    const char *output = nullptr;
    std::optional<std::uint64_t> native_build;
    std::optional<std::uint64_t> timeout_ms;
    bool progress = false;
    bool verbose = false;

    static option long_opts[] = {
        {"config-url", required_argument, nullptr, 'u'},
        {"content-root", required_argument, nullptr, 'r'},
        {"current", required_argument, nullptr, 'c'},
        {"native-build", required_argument, nullptr, 'n'},
        {"timeout", required_argument, nullptr, 't'},
        {"progress", no_argument, nullptr, 'p'},
        {"verbose", no_argument, nullptr, 'v'},
        {"build-manifest", required_argument, nullptr, 'm'},
        {"output", required_argument, nullptr, 'o'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hu:r:c:n:t:pvm:o:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'u':
                config_url = optarg;
                break;

            case 'r':
                content_root = optarg;
                break;

            case 'c':
                current = optarg;
                break;

            case 'n': {
                std::uint64_t v = 0;
                if (!ParseNonNegative(optarg, v) || v > INT_MAX) {
                    std::fprintf(stderr, "Invalid --native-build: %s\n", optarg);
                    return 2;
                }
                native_build = v;
                break;
            }

            case 't': {
                std::uint64_t v = 0;
                if (!ParseNonNegative(optarg, v) || v > LONG_MAX) {
                    std::fprintf(stderr, "Invalid --timeout: %s\n", optarg);
                    return 2;
                }
                timeout_ms = v;
                break;
            }

            case 'p':
                progress = true;
                break;

            case 'v':
                verbose = true;
                break;

            case 'm':
                manifest_dir = optarg;
                break;

            case 'o':
                output = optarg;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (verbose) {
        hotpush::Logger::Instance().SetLevel(hotpush::LogLevel::Debug);
    }

    if (manifest_dir) {
        return BuildManifest(manifest_dir, output);
    }

    const char *env_path = std::getenv("HOTPUSH_CONFIG_PATH");
    const std::string config_path = (env_path && *env_path) ? env_path : kDefaultConfigPath;

    const bool cli_complete = config_url && content_root && current && native_build.has_value();

    hotpush::config::UpdaterConfigFromFile cfg;
    const bool cfg_ok = cfg.LoadFile(config_path);
    if (!cfg_ok && !cli_complete) {
        std::fprintf(stderr, "ERROR: cannot load config: %s\n", config_path.c_str());
        PrintUsage(argv[0]);
        return 2;
    }
    if (!cfg_ok) {
        LogDebug("Config %s not loaded, using command line only", config_path.c_str());
    }

    if (cfg_ok && !verbose && cfg.log_level) {
        hotpush::LogLevel lvl{};
        if (hotpush::ParseLogLevel(*cfg.log_level, lvl)) {
            hotpush::Logger::Instance().SetLevel(lvl);
        }
    }

    hotpush::UpdateRequest request;
    request.config_url = config_url ? config_url : cfg.config_url;
    request.content_root = content_root ? content_root : cfg.content_root;
    request.installed_release = current ? current : cfg.installed_release;

    if (!native_build && cfg.native_build_version && *cfg.native_build_version <= INT_MAX) {
        native_build = cfg.native_build_version;
    }
    if (!timeout_ms && cfg.timeout_ms) {
        timeout_ms = cfg.timeout_ms;
    }
    if (!progress && cfg.progress.has_value()) {
        progress = *cfg.progress;
    }

    if (request.config_url.empty() || request.content_root.empty() ||
        request.installed_release.empty() || !native_build) {
        std::fprintf(stderr, "ERROR: config url, content root, installed release and native build are required\n");
        PrintUsage(argv[0]);
        return 2;
    }

    hotpush::CurlTransport::Options transport_opt;
    if (timeout_ms) {
        transport_opt.timeout_ms = static_cast<long>(*timeout_ms);
    }

    hotpush::UpdateLoaderWorker::Collaborators collaborators{
        .transport = std::make_shared<hotpush::CurlTransport>(transport_opt),
        .file_system = hotpush::DefaultFileSystem(),
        .storage = std::make_shared<hotpush::FileDocumentStorage>(),
        .version_oracle =
            std::make_shared<hotpush::FixedNativeVersion>(static_cast<int>(*native_build)),
    };

    hotpush::UpdateLoaderWorker worker(request, collaborators);
    hotpush::ConsoleProgressSink console_progress;
    if (progress) {
        worker.SetProgressSink(&console_progress);
    }

    const hotpush::UpdateOutcome outcome = worker.Run();
    PrintOutcome(outcome);
    return outcome.IsError() ? 1 : 0;
}
