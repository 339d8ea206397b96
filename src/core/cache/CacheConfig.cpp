#include "core/cache/CacheConfig.hpp"
#include "core/util/Errors.hpp"
#include <cstdlib>
#include <fstream>

namespace offcache {
namespace core {
namespace cache {

namespace {

std::chrono::milliseconds readMillis(const nlohmann::json& j, const char* key, std::chrono::milliseconds fallback) {
    if (!j.contains(key)) return fallback;
    const auto& value = j.at(key);
    if (!value.is_number_integer() && !value.is_number_unsigned()) {
        throw ConfigError(std::string("config: '") + key + "' must be an integer (milliseconds)");
    }
    auto ms = value.get<int64_t>();
    if (ms < 0) {
        throw ConfigError(std::string("config: '") + key + "' must not be negative");
    }
    return std::chrono::milliseconds(ms);
}

uint64_t readCount(const nlohmann::json& j, const char* key, uint64_t fallback) {
    if (!j.contains(key)) return fallback;
    const auto& value = j.at(key);
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (!value.is_number_integer()) {
        throw ConfigError(std::string("config: '") + key + "' must be a non-negative integer");
    }
    if (value.get<int64_t>() < 0) {
        throw ConfigError(std::string("config: '") + key + "' must not be negative");
    }
    return static_cast<uint64_t>(value.get<int64_t>());
}

} // namespace

CacheConfig configFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("config: top-level value must be an object");
    }
    CacheConfig config;
    try {
        config.rootPath = j.value("rootPath", config.rootPath);
        config.retentionPeriod = readMillis(j, "retentionMs", config.retentionPeriod);
        config.stalenessThreshold = readMillis(j, "stalenessMs", config.stalenessThreshold);
        config.changeDetectionInterval = readMillis(j, "changeDetectionIntervalMs", config.changeDetectionInterval);
        config.tempMaxAge = readMillis(j, "tempMaxAgeMs", config.tempMaxAge);
        config.sizeThresholdBytes = readCount(j, "sizeThresholdBytes", config.sizeThresholdBytes);
        config.minItemsToKeep = static_cast<size_t>(readCount(j, "minItemsToKeep", config.minItemsToKeep));
        if (j.contains("logging")) {
            const auto& log = j.at("logging");
            config.logging.level = log.value("level", config.logging.level);
            config.logging.logPath = log.value("logPath", config.logging.logPath);
            config.logging.maxLogSize = static_cast<size_t>(readCount(log, "maxLogSize", config.logging.maxLogSize));
            config.logging.maxLogFiles = static_cast<size_t>(readCount(log, "maxLogFiles", config.logging.maxLogFiles));
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("config: ") + e.what());
    }
    if (!config.validate()) {
        throw ConfigError("config: invalid configuration values");
    }
    return config;
}

nlohmann::json configToJson(const CacheConfig& config) {
    return {
        {"rootPath", config.rootPath},
        {"retentionMs", config.retentionPeriod.count()},
        {"stalenessMs", config.stalenessThreshold.count()},
        {"sizeThresholdBytes", config.sizeThresholdBytes},
        {"minItemsToKeep", config.minItemsToKeep},
        {"changeDetectionIntervalMs", config.changeDetectionInterval.count()},
        {"tempMaxAgeMs", config.tempMaxAge.count()},
        {"logging", {
            {"level", config.logging.level},
            {"logPath", config.logging.logPath},
            {"maxLogSize", config.logging.maxLogSize},
            {"maxLogFiles", config.logging.maxLogFiles}
        }}
    };
}

CacheConfig loadConfig(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw ConfigError("config: cannot open " + path);
    }
    nlohmann::json j;
    try {
        ifs >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("config: " + path + ": " + e.what());
    }
    CacheConfig config = configFromJson(j);
    applyEnvironment(config);
    return config;
}

void applyEnvironment(CacheConfig& config) {
    if (const char* root = std::getenv("OFFCACHE_ROOT")) {
        if (*root != '\0') {
            config.rootPath = root;
        }
    }
}

} // namespace cache
} // namespace core
} // namespace offcache
