#include "core/util/Logging.hpp"
#include <cstdlib>
#include <filesystem>
#include <vector>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace offcache {
namespace core {
namespace util {

namespace {

spdlog::level::level_enum resolveLevel(const LoggingConfig& config) {
    if (const char* level = std::getenv("OFFCACHE_LOG_LEVEL")) {
        return spdlog::level::from_str(level);
    }
    return spdlog::level::from_str(config.level);
}

} // namespace

std::shared_ptr<spdlog::logger> initializeLogging(const LoggingConfig& config) {
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        existing->set_level(resolveLevel(config));
        return existing;
    }

    std::vector<spdlog::sink_ptr> sinks;
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    sinks.push_back(console_sink);

    if (!config.logPath.empty()) {
        try {
            auto parent = std::filesystem::path(config.logPath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.logPath, config.maxLogSize, config.maxLogFiles);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        } catch (const std::exception& e) {
            // Без файла продолжаем с консолью
            spdlog::error("offcache: не удалось открыть лог-файл {}: {}", config.logPath, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(resolveLevel(config));
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name) {
    auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    return std::make_shared<spdlog::logger>(name, sink);
}

void shutdownLogging() {
    spdlog::drop(LOGGER_NAME);
}

} // namespace util
} // namespace core
} // namespace offcache
