// Sync
#include "sync/Pipeline.hpp"
#include "sync/EventLoop.hpp"
#include "sync/CursorStore.hpp"

// Collaborators
#include "remote/DropboxSource.hpp"
#include "auth/TokenProvider.hpp"
#include "build/Executor.hpp"
#include "mirror/Copier.hpp"
#include "crypto/ContentHasher.hpp"

// Front end
#include "protocols/http/Router.hpp"
#include "services/HttpService.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "util/curlWrappers.hpp"

// Libraries
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace mh;
using namespace mh::config;
using namespace mh::log;

namespace {
constexpr auto DEFAULT_CONFIG_PATH = "config.yaml";

std::atomic shouldExit = false;
std::atomic reopenLogs = false;

void signalHandler(const int signum) {
    if (signum == SIGHUP) reopenLogs = true;
    else shouldExit = true;
}

void usage(std::ostream& out) {
    out << "Usage: mirrorhall [-c <config.yaml>] <command>\n"
           "\n"
           "Commands:\n"
           "  start             run the sync loop and webhook server (default)\n"
           "  sync [--full]     run one sync cycle and exit\n"
           "  hash <file>...    print content hashes\n"
           "  init-config       write a default configuration file\n";
}

std::shared_ptr<sync::Pipeline> makePipeline(const Config& cfg) {
    auto tokens = auth::makeTokenProvider(cfg.remote);

    if (cfg.remote.provider != "dropbox")
        throw std::runtime_error(fmt::format("Unsupported remote provider '{}'", cfg.remote.provider));

    return std::make_shared<sync::Pipeline>(
        cfg,
        std::make_shared<remote::DropboxSource>(cfg.remote, std::move(tokens)),
        std::make_shared<sync::CursorStore>(cfg.sync.cursorPath()),
        std::make_shared<build::ShellExecutor>(),
        std::make_shared<mirror::Copier>());
}

int runHash(const std::vector<std::string>& files) {
    if (files.empty()) {
        usage(std::cerr);
        return EXIT_FAILURE;
    }

    int rc = EXIT_SUCCESS;
    for (const auto& f : files) {
        try {
            std::cout << crypto::ContentHasher::hashFile(f) << "  " << f << '\n';
        } catch (const std::exception& e) {
            std::cerr << "mirrorhall: " << e.what() << '\n';
            rc = EXIT_FAILURE;
        }
    }
    return rc;
}

int runInitConfig(const std::filesystem::path& path) {
    if (std::filesystem::exists(path)) {
        std::cerr << "mirrorhall: " << path.string() << " already exists\n";
        return EXIT_FAILURE;
    }
    defaultConfig().save(path);
    std::cout << "Wrote default configuration to " << path.string() << '\n';
    return EXIT_SUCCESS;
}

int runOnce(const bool full) {
    const auto pipeline = makePipeline(ConfigRegistry::get());
    const auto trigger = full ? sync::model::Trigger::forceFullSync() : sync::model::Trigger::remoteChanged();
    const auto report = pipeline->run(trigger);
    std::cout << nlohmann::json(report).dump(2) << '\n';
    return report.aborted() ? EXIT_FAILURE : EXIT_SUCCESS;
}

int runDaemon() {
    const auto& cfg = ConfigRegistry::get();
    const auto pipeline = makePipeline(cfg);

    auto loop = std::make_shared<sync::EventLoop>(
        [pipeline](const sync::model::Trigger& t) { return pipeline->run(t); },
        cfg.sync.coalesce_remote_changed);
    loop->start();

    std::unique_ptr<services::HttpService> http;
    if (cfg.server.enabled) {
        auto router = std::make_shared<const protocols::http::Router>(protocols::http::RouterContext{
            .server = cfg.server,
            .enqueue = [loop](sync::model::Trigger t) { return loop->push(std::move(t)); },
            .status = [loop, &cfg] {
                nlohmann::json j{
                    {"queue_depth", loop->queueDepth()},
                    {"busy", loop->busy()},
                    {"cycles_run", loop->cyclesRun()},
                    {"sync", cfg.sync},
                    {"build", cfg.build},
                    {"copy_rules", cfg.copy_rules}
                };
                if (const auto last = loop->lastReport()) j["last_report"] = *last;
                else j["last_report"] = nullptr;
                return j;
            }
        });
        http = std::make_unique<services::HttpService>(cfg.server, std::move(router));
        http->start();
    } else {
        Registry::mirrorhall()->info("[*] HTTP front end is disabled in configuration.");
    }

    if (cfg.sync.sync_on_startup) loop->push(sync::model::Trigger::forceFullSync());

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);

    Registry::mirrorhall()->info("[✓] mirrorhall started, syncing {} into {}",
                                 cfg.remote.root, cfg.sync.local_base_path.string());

    while (!shouldExit) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        if (reopenLogs.exchange(false)) Registry::reopenMainLog();
        if (http && !http->isRunning()) {
            Registry::mirrorhall()->error("[-] HTTP front end stopped unexpectedly, shutting down.");
            shouldExit = true;
        }
    }

    Registry::mirrorhall()->info("[*] Shutting down...");
    if (http) http->stop();
    loop->stop();
    Registry::mirrorhall()->info("[✓] mirrorhall shut down cleanly.");
    return EXIT_SUCCESS;
}

}

int main(int argc, char** argv) {
    std::filesystem::path configPath = DEFAULT_CONFIG_PATH;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                usage(std::cerr);
                return EXIT_FAILURE;
            }
            configPath = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            usage(std::cout);
            return EXIT_SUCCESS;
        } else {
            args.push_back(arg);
        }
    }

    const std::string command = args.empty() ? "start" : args.front();
    const std::vector rest(args.begin() + (args.empty() ? 0 : 1), args.end());

    if (command == "hash") return runHash(rest);
    if (command == "init-config") return runInitConfig(configPath);

    if (command != "start" && command != "sync") {
        std::cerr << "mirrorhall: unknown command '" << command << "'\n";
        usage(std::cerr);
        return EXIT_FAILURE;
    }

    try {
        ConfigRegistry::init(loadConfig(configPath));
        Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "mirrorhall: failed to initialize: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    try {
        const util::CurlGlobal curl;

        if (command == "sync") {
            bool full = false;
            for (const auto& a : rest) {
                if (a == "--full") full = true;
                else {
                    std::cerr << "mirrorhall: unknown option '" << a << "'\n";
                    return EXIT_FAILURE;
                }
            }
            return runOnce(full);
        }

        return runDaemon();
    } catch (const std::exception& e) {
        Registry::mirrorhall()->error("[-] {}", e.what());
        return EXIT_FAILURE;
    }
}
