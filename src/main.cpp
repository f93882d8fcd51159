#include "server/http_server.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"
#include "util/server_config.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <optional>
#include <string>
#include <sys/stat.h>
#include <thread>

namespace {

constexpr const char *kDefaultConfigPath = "/etc/otasrv/otasrv.json";

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config.json>] [-d <dir>] [-p <port>] [-l <addr>] [-b <url>] [-v <level>]\n"
        "\n"
        "Options:\n"
        "  -c, --config      JSON config file (default /etc/otasrv/otasrv.json)\n"
        "  -d, --files-dir   Directory holding <family>_<version><ext> artifacts\n"
        "  -p, --port        Listening port (default 8080, 0 picks a free port)\n"
        "  -l, --listen      Listening address (default 0.0.0.0)\n"
        "  -b, --base-url    Prefix for download locators, e.g. http://ota.local:8080\n"
        "  -v, --log-level   debug, info, warn, error or none\n"
        "  -h, --help        Show this help\n",
        argv);
}

bool FileExists(const std::string &path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

} // namespace

int main(int argc, char **argv) {
    std::optional<std::string> config_cli;
    std::optional<std::string> files_dir_cli;
    std::optional<std::uint16_t> port_cli;
    std::optional<std::string> listen_cli;
    std::optional<std::string> base_url_cli;
    std::optional<otasrv::LogLevel> level_cli;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"files-dir", required_argument, nullptr, 'd'},
        {"port", required_argument, nullptr, 'p'},
        {"listen", required_argument, nullptr, 'l'},
        {"base-url", required_argument, nullptr, 'b'},
        {"log-level", required_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:d:p:l:b:v:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_cli = optarg;
                break;

            case 'd':
                files_dir_cli = optarg;
                break;

            case 'p': {
                char *end = nullptr;
                unsigned long v = std::strtoul(optarg, &end, 10);
                if (!end || *end != '\0' || *optarg == '\0' || v > 65535) {
                    std::fprintf(stderr, "Invalid --port: %s\n", optarg);
                    return 2;
                }
                port_cli = static_cast<std::uint16_t>(v);
                break;
            }

            case 'l':
                listen_cli = optarg;
                break;

            case 'b':
                base_url_cli = optarg;
                break;

            case 'v': {
                auto lvl = otasrv::ParseLogLevel(optarg);
                if (!lvl) {
                    std::fprintf(stderr, "Invalid --log-level: %s\n", optarg);
                    return 2;
                }
                level_cli = *lvl;
                break;
            }

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind < argc) {
        PrintUsage(argv[0]);
        return 2;
    }

    otasrv::config::ServerConfig cfg;
    const std::string config_path = config_cli.value_or(kDefaultConfigPath);
    if (config_cli || FileExists(config_path)) {
        if (auto r = cfg.LoadFile(config_path); !r.ok) {
            LogError("cannot load config %s: %s", config_path.c_str(), r.msg.c_str());
            return 1;
        }
    } else {
        LogWarn("no config at %s, using defaults", config_path.c_str());
    }

    if (files_dir_cli) cfg.files_dir = *files_dir_cli;
    if (port_cli) cfg.port = *port_cli;
    if (listen_cli) cfg.listen_address = *listen_cli;
    if (base_url_cli) cfg.base_url = *base_url_cli;
    if (level_cli) cfg.log_level = *level_cli;

    if (auto r = cfg.Validate(); !r.ok) {
        LogError("invalid configuration: %s", r.msg.c_str());
        return 1;
    }
    otasrv::Logger::Instance().SetLevel(cfg.log_level);
    otasrv::InstallSignalHandlers();

    otasrv::OtaHttpServer server(cfg);
    if (auto r = server.Bind(); !r.ok) {
        LogError("%s", r.msg.c_str());
        return 1;
    }

    std::atomic_bool finished{false};
    std::thread watcher([&server, &finished] {
        while (!finished.load() && !otasrv::g_cancel.load(std::memory_order_relaxed)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        if (!finished.load()) {
            LogInfo("shutting down");
            server.Stop();
        }
    });

    auto res = server.Run();
    finished.store(true);
    watcher.join();

    if (!res.ok) {
        LogError("%s", res.msg.c_str());
        return 1;
    }
    return 0;
}
