#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "core/fs/FileSystem.hpp"
#include "core/util/Clock.hpp"

namespace offcache {
namespace core {
namespace cache {

// Имена каталогов и файлов относительно корня кэша
constexpr const char* OFFLINE_CACHE_DIR = "offline-cache";
constexpr const char* PROCESSED_DIR = "processed";
constexpr const char* TEMP_DIR = "temp";
constexpr const char* INDEX_FILE = "cache-index.json";
constexpr const char* REGISTRY_FILE = "hash-registry.json";

// CachePaths — все пути, выведенные из корня; других источников путей нет
struct CachePaths {
    std::string root;
    std::string offlineCache; // Payload-файлы и индекс
    std::string processed;    // Обработанные записи
    std::string temp;         // Временные файлы
    std::string indexFile;
    std::string registryFile;

    static CachePaths fromRoot(const std::string& rootPath);
    std::string payloadFile(const std::string& hash) const; // {offlineCache}/{hash}.json
};

enum class CacheSubDir {
    Root,
    OfflineCache,
    Processed,
    Temp
};

// CacheContext — корень, файловая система, часы и логгер; передаётся каждому компоненту
struct CacheContext {
    CachePaths paths;
    std::shared_ptr<fs::IFileSystem> fileSystem;
    std::shared_ptr<util::IClock> clock;
    std::shared_ptr<spdlog::logger> logger;

    // Пустые fs/clock/logger заменяются локальной ФС, системными часами и null-логгером
    static std::shared_ptr<CacheContext> create(const std::string& rootPath,
                                                std::shared_ptr<fs::IFileSystem> fileSystem = nullptr,
                                                std::shared_ptr<util::IClock> clock = nullptr,
                                                std::shared_ptr<spdlog::logger> logger = nullptr);

    fs::IFileSystem& files() const { return *fileSystem; }
    util::TimePoint now() const { return clock->now(); }
    spdlog::logger& log() const { return *logger; }
    std::string pathFor(CacheSubDir subDir, const std::string& filename) const; // Путь к файлу внутри подкаталога
};

} // namespace cache
} // namespace core
} // namespace offcache
