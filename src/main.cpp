#include "migfetch/binary_fetcher.hpp"
#include "migfetch/daemon_client.hpp"
#include "migfetch/fetcher.hpp"
#include "migfetch/http_client.hpp"
#include "migfetch/platform.hpp"
#include "migfetch/version_catalog.hpp"
#include "system/signals.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options] versions <dist> [--desc]\n"
        "   %s [options] latest <dist>\n"
        "   %s [options] fetch <dist> <version> -o <output> [--archive-name <name>] [--binary-name <name>]\n"
        "   %s [options] platform\n"
        "\n"
        "Options:\n"
        "  -c, --config           Config file (default %s)\n"
        "  -g, --gateway          Gateway base URL (default %s)\n"
        "  -d, --dist-root        Distribution root path (default %s)\n"
        "      --gateway-only     Do not try the local daemon\n"
        "  -o, --output           Output file or directory for fetch\n"
        "      --desc             List versions newest first\n"
        "      --archive-name     Archive base name (default <dist>)\n"
        "      --binary-name      Binary name inside the archive (default archive name)\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n",
        argv, argv, argv, argv, migfetch::config::kDefaultConfigPath, migfetch::kDefaultGatewayUrl,
        migfetch::kDefaultDistPath);
}

enum LongOnly : int {
    kOptGatewayOnly = 256,
    kOptDesc,
    kOptArchiveName,
    kOptBinaryName,
};

bool FileExists(const std::string &path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

int Fail(const migfetch::Result &r) {
    std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
    return 1;
}

} // namespace

int main(int argc, char **argv) {
    migfetch::InstallSignalHandlers();

    std::string config_path = migfetch::config::kDefaultConfigPath;
    bool config_explicit = false;
    const char *gateway_cli = nullptr;
    const char *dist_root_cli = nullptr;
    std::string output;
    std::string archive_name;
    std::string binary_name;
    bool gateway_only = false;
    bool descending = false;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"gateway", required_argument, nullptr, 'g'},
        {"dist-root", required_argument, nullptr, 'd'},
        {"output", required_argument, nullptr, 'o'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {"gateway-only", no_argument, nullptr, kOptGatewayOnly},
        {"desc", no_argument, nullptr, kOptDesc},
        {"archive-name", required_argument, nullptr, kOptArchiveName},
        {"binary-name", required_argument, nullptr, kOptBinaryName},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hvc:g:d:o:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'v':
                verbose = true;
                break;

            case 'c':
                config_path = optarg;
                config_explicit = true;
                break;

            case 'g':
                gateway_cli = optarg;
                break;

            case 'd':
                dist_root_cli = optarg;
                break;

            case 'o':
                output = optarg;
                break;

            case kOptGatewayOnly:
                gateway_only = true;
                break;

            case kOptDesc:
                descending = true;
                break;

            case kOptArchiveName:
                archive_name = optarg;
                break;

            case kOptBinaryName:
                binary_name = optarg;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    std::vector<std::string> args(argv + optind, argv + argc);
    if (args.empty()) {
        PrintUsage(argv[0]);
        return 2;
    }
    const std::string command = args[0];

    migfetch::config::MigfetchConfigFromFile cfg;
    if (config_explicit || FileExists(config_path)) {
        if (auto r = cfg.LoadFile(config_path); !r.ok) {
            return Fail(r);
        }
    }

    auto &logger = migfetch::Logger::Instance();
    if (cfg.log_level) {
        migfetch::LogLevel lvl{};
        if (migfetch::ParseLogLevel(*cfg.log_level, lvl)) logger.SetLevel(lvl);
    }
    if (verbose) logger.SetLevel(migfetch::LogLevel::Debug);

    migfetch::FetcherConfig fcfg;
    if (cfg.gateway_url) fcfg.gateway_url = *cfg.gateway_url;
    if (cfg.user_agent) fcfg.user_agent = *cfg.user_agent;
    if (cfg.request_timeout_seconds) fcfg.request_timeout = std::chrono::seconds(*cfg.request_timeout_seconds);
    if (cfg.fetch_size_limit) fcfg.size_limit = *cfg.fetch_size_limit;
    if (gateway_cli) fcfg.gateway_url = gateway_cli;
    while (fcfg.gateway_url.size() > 1 && fcfg.gateway_url.back() == '/') fcfg.gateway_url.pop_back();

    std::string dist_root = cfg.dist_path.value_or(migfetch::kDefaultDistPath);
    if (dist_root_cli) dist_root = dist_root_cli;

    const std::string repo_path = cfg.ipfs_path.value_or(migfetch::DefaultRepoPath());

    auto http = migfetch::MakeCurlHttpClient();
    std::shared_ptr<const migfetch::IDaemonConnector> daemon;
    if (!gateway_only) daemon = migfetch::MakeHttpApiDaemonConnector(http, repo_path);
    migfetch::Fetcher fetcher(fcfg, daemon, http);

    auto &ctx = migfetch::g_cancel;

    if (command == "versions" || command == "latest") {
        if (args.size() != 2) {
            PrintUsage(argv[0]);
            return 2;
        }
        migfetch::VersionCatalog catalog(fetcher, dist_root);

        if (command == "latest") {
            std::string latest;
            if (auto r = catalog.LatestStable(ctx, args[1], latest); !r.ok) return Fail(r);
            std::printf("%s\n", latest.c_str());
            return 0;
        }

        std::vector<std::string> versions;
        if (auto r = catalog.ListVersions(ctx, args[1], descending, versions); !r.ok) return Fail(r);
        for (const auto &v : versions) {
            std::printf("%s\n", v.c_str());
        }
        return 0;
    }

    if (command == "platform" || command == "fetch") {
        migfetch::PlatformProbe probe;
        migfetch::PlatformId platform;
        if (auto r = probe.Probe(ctx, platform); !r.ok) return Fail(r);

        if (command == "platform") {
            if (args.size() != 1) {
                PrintUsage(argv[0]);
                return 2;
            }
            std::printf("%s-%s\n", platform.OsWithVariant().c_str(), platform.arch.c_str());
            return 0;
        }

        if (args.size() != 3 || output.empty()) {
            PrintUsage(argv[0]);
            return 2;
        }

        migfetch::BinaryFetcher::Options bopt;
        bopt.dist_root = dist_root;
        migfetch::BinaryFetcher binary_fetcher(fetcher, platform, bopt);

        migfetch::InstallResult installed;
        if (auto r = binary_fetcher.FetchBinary(ctx, args[1], args[2], archive_name, binary_name, output, installed);
            !r.ok) {
            return Fail(r);
        }
        std::printf("%s\n", installed.path.c_str());
        return 0;
    }

    std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
    PrintUsage(argv[0]);
    return 2;
}
