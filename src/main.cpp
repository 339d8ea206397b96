#include <iostream>
#include <memory>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/cache/CacheConfig.hpp"
#include "core/cache/manager/CacheEngine.hpp"
#include "core/cache/policy/SizePruner.hpp"
#include "core/thread/Scheduler.hpp"
#include "core/util/Errors.hpp"
#include "core/util/Logging.hpp"

using namespace offcache::core;

// Global flag for graceful shutdown of `watch`
std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

namespace {

struct CommandLine {
    std::string command;
    std::vector<std::string> args;
    std::string configPath;
    std::string rootPath;
};

void printUsage() {
    std::cerr <<
        "Usage: offcache [--config <file>] [--root <dir>] <command> [args]\n"
        "Commands:\n"
        "  init                     create the cache layout\n"
        "  stats                    print index statistics (JSON)\n"
        "  retention                remove entries older than the retention period\n"
        "  prune                    evict least-recently-used entries above the size threshold\n"
        "  maintain                 retention, pruning and temp cleanup\n"
        "  detect                   invalidate entries of changed source files\n"
        "  track <file> <hash>...   track a source file and the entries derived from it\n"
        "  untrack <file>           stop tracking a source file\n"
        "  reconcile                repair the index against payload files\n"
        "  watch                    run change detection until interrupted\n";
}

bool parseCommandLine(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--root") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            (arg == "--config" ? cmd.configPath : cmd.rootPath) = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else if (cmd.command.empty()) {
            cmd.command = arg;
        } else {
            cmd.args.push_back(arg);
        }
    }
    return !cmd.command.empty();
}

cache::CacheConfig resolveConfig(const CommandLine& cmd) {
    cache::CacheConfig config;
    if (!cmd.configPath.empty()) {
        config = cache::loadConfig(cmd.configPath);
    } else {
        cache::applyEnvironment(config);
    }
    if (!cmd.rootPath.empty()) {
        config.rootPath = cmd.rootPath;
    }
    return config;
}

nlohmann::json errorsJson(const std::vector<std::string>& errors) {
    return nlohmann::json(errors);
}

int runWatch(cache::CacheEngine& engine) {
    if (!engine.startChangeDetection(std::make_shared<thread::ThreadScheduler>(spdlog::get(util::LOGGER_NAME)))) {
        spdlog::get(util::LOGGER_NAME)->error("Failed to start change detection");
        return 1;
    }
    spdlog::get(util::LOGGER_NAME)->info("Watching tracked files every {} ms, press Ctrl+C to stop",
                                         engine.config().changeDetectionInterval.count());
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    engine.stopChangeDetection();
    spdlog::get(util::LOGGER_NAME)->info("Change detection stopped");
    return 0;
}

int runCommand(const CommandLine& cmd, cache::CacheEngine& engine) {
    const auto& config = engine.config();
    auto logger = spdlog::get(util::LOGGER_NAME);

    if (cmd.command == "init") {
        auto result = engine.initialize();
        std::cout << nlohmann::json{{"success", result.success}, {"root", result.paths.root},
                                    {"errors", errorsJson(result.errors)}}.dump(2) << std::endl;
        return result.success ? 0 : 1;
    }
    if (cmd.command == "stats") {
        auto info = engine.pruner().getCacheSizeInfo();
        nlohmann::json out = engine.stats().toJson();
        out["formattedSize"] = cache::SizePruner::formatBytes(info.totalBytes);
        out["averageItemSize"] = info.averageItemSize;
        std::cout << out.dump(2) << std::endl;
        return 0;
    }
    if (cmd.command == "retention") {
        auto result = engine.retention().applyRetentionPolicy(config.retentionPeriod);
        logger->info("Retention: removed {}, freed {}", result.removedCount,
                     cache::SizePruner::formatBytes(result.bytesFreed));
        return result.success ? 0 : 1;
    }
    if (cmd.command == "prune") {
        auto result = engine.pruner().pruneCacheLRU(config.sizeThresholdBytes, config.minItemsToKeep);
        logger->info("Prune: removed {}, freed {}, size {} / {}", result.removedCount,
                     cache::SizePruner::formatBytes(result.bytesFreed),
                     cache::SizePruner::formatBytes(result.currentSize),
                     cache::SizePruner::formatBytes(result.threshold));
        return result.success ? 0 : 1;
    }
    if (cmd.command == "maintain") {
        auto report = engine.runMaintenance();
        std::cout << report.toJson().dump(2) << std::endl;
        return report.success() ? 0 : 1;
    }
    if (cmd.command == "detect") {
        auto result = engine.changeDetector().detectAndInvalidateChanges();
        logger->info("Detect: scanned {}, changed {}, invalidated {}", result.filesScanned,
                     result.filesChanged, result.cacheEntriesInvalidated);
        for (const auto& error : result.errors) {
            logger->warn("Detect: {}", error);
        }
        return result.success ? 0 : 1;
    }
    if (cmd.command == "track") {
        if (cmd.args.empty()) {
            printUsage();
            return 2;
        }
        std::vector<std::string> hashes(cmd.args.begin() + 1, cmd.args.end());
        if (!engine.changeDetector().registerFile(cmd.args[0], hashes)) {
            logger->error("Cannot track {}", cmd.args[0]);
            return 1;
        }
        return 0;
    }
    if (cmd.command == "untrack") {
        if (cmd.args.size() != 1) {
            printUsage();
            return 2;
        }
        if (!engine.changeDetector().untrackFile(cmd.args[0])) {
            logger->warn("{} is not tracked", cmd.args[0]);
            return 1;
        }
        return 0;
    }
    if (cmd.command == "reconcile") {
        auto result = engine.reconcile();
        std::cout << nlohmann::json{{"removedOrphans", result.removedOrphans},
                                    {"addedMissing", result.addedMissing},
                                    {"sizesCorrected", result.sizesCorrected},
                                    {"errors", errorsJson(result.errors)}}.dump(2) << std::endl;
        return result.success ? 0 : 1;
    }
    if (cmd.command == "watch") {
        return runWatch(engine);
    }

    std::cerr << "Unknown command: " << cmd.command << std::endl;
    printUsage();
    return 2;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd)) {
        printUsage();
        return 2;
    }

    try {
        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);

        cache::CacheConfig config = resolveConfig(cmd);
        auto logger = util::initializeLogging(config.logging);

        cache::CacheEngine engine(config, nullptr, nullptr, logger);
        if (cmd.command != "init" && !engine.structure().isStructureValid()) {
            auto structure = engine.initialize();
            if (!structure.success) {
                for (const auto& error : structure.errors) {
                    logger->error("{}", error);
                }
                return 1;
            }
        }

        int code = runCommand(cmd, engine);
        engine.shutdown();
        util::shutdownLogging();
        return code;
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
