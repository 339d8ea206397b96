#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include "core/cache/CacheConfig.hpp"
#include "core/util/Errors.hpp"

using namespace offcache::core;

void testDefaults() {
    std::cout << "Testing CacheConfig defaults...\n";
    cache::CacheConfig config;
    assert(config.validate());
    assert(config.retentionPeriod == std::chrono::hours(24 * 7));
    assert(config.stalenessThreshold == std::chrono::hours(24));
    assert(config.changeDetectionInterval == std::chrono::minutes(5));
    assert(config.sizeThresholdBytes == 100ULL * 1024 * 1024);
    assert(config.minItemsToKeep == 10);
    std::cout << "[OK] CacheConfig defaults\n";
}

void testFromJson() {
    std::cout << "Testing CacheConfig from JSON...\n";
    auto config = cache::configFromJson({
        {"rootPath", "/var/cache/offcache"},
        {"retentionMs", 3600000},
        {"sizeThresholdBytes", 2048},
        {"minItemsToKeep", 2},
        {"logging", {{"level", "debug"}}}
    });
    assert(config.rootPath == "/var/cache/offcache");
    assert(config.retentionPeriod == std::chrono::hours(1));
    assert(config.sizeThresholdBytes == 2048);
    assert(config.minItemsToKeep == 2);
    assert(config.logging.level == "debug");
    // Не заданные ключи остаются по умолчанию
    assert(config.stalenessThreshold == cache::DEFAULT_STALENESS_MS);

    auto back = cache::configFromJson(cache::configToJson(config));
    assert(back.rootPath == config.rootPath);
    assert(back.retentionPeriod == config.retentionPeriod);
    std::cout << "[OK] CacheConfig from JSON\n";
}

void testInvalidConfig() {
    std::cout << "Testing invalid CacheConfig...\n";
    auto throwsConfigError = [](const nlohmann::json& j) {
        try {
            cache::configFromJson(j);
        } catch (const ConfigError&) {
            return true;
        }
        return false;
    };
    assert(throwsConfigError(nlohmann::json::array()));
    assert(throwsConfigError({{"retentionMs", "week"}}));
    assert(throwsConfigError({{"retentionMs", -5}}));
    assert(throwsConfigError({{"retentionMs", 0}}));
    assert(throwsConfigError({{"rootPath", ""}}));
    assert(throwsConfigError({{"sizeThresholdBytes", -1}}));
    assert(throwsConfigError({{"minItemsToKeep", -3}}));
    assert(throwsConfigError({{"minItemsToKeep", 2.5}}));
    assert(throwsConfigError({{"logging", {{"maxLogFiles", -1}}}}));

    bool threw = false;
    try {
        cache::loadConfig("/nonexistent/offcache.json");
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[OK] invalid CacheConfig\n";
}

void testLoadConfigWithEnvironment() {
    std::cout << "Testing loadConfig with OFFCACHE_ROOT...\n";
    auto path = std::filesystem::temp_directory_path() / "offcache-config-test.json";
    {
        std::ofstream out(path);
        out << R"({"rootPath": "/from/file", "minItemsToKeep": 3})";
    }
    unsetenv("OFFCACHE_ROOT");
    auto config = cache::loadConfig(path.string());
    assert(config.rootPath == "/from/file");
    assert(config.minItemsToKeep == 3);

    setenv("OFFCACHE_ROOT", "/from/env", 1);
    config = cache::loadConfig(path.string());
    assert(config.rootPath == "/from/env");
    unsetenv("OFFCACHE_ROOT");

    std::filesystem::remove(path);
    std::cout << "[OK] loadConfig with OFFCACHE_ROOT\n";
}

int main() {
    try {
        testDefaults();
        testFromJson();
        testInvalidConfig();
        testLoadConfigWithEnvironment();
        std::cout << "All CacheConfig tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "CacheConfig test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
