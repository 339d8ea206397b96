#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/util/Clock.hpp"

namespace offcache {
namespace core {
namespace cache {

constexpr const char* INDEX_VERSION = "1.0.0";
constexpr const char* REGISTRY_VERSION = "1.0.0";

// CachedPayload — содержимое файла {hash}.json; неизменяемо после записи
struct CachedPayload {
    std::string hash;
    nlohmann::json data;
    std::string source;   // Источник (llm, github, user...)
    std::string type;     // Тип/категория
    util::TimePoint cachedAt;
    std::optional<nlohmann::json> metadata;

    nlohmann::json toJson() const;
    static CachedPayload fromJson(const nlohmann::json& j);
};

// IndexItem — запись каталога о сохранённом payload
struct IndexItem {
    std::string hash;
    std::string source;
    std::string type;
    util::TimePoint cachedAt;
    std::optional<util::TimePoint> lastAccessedAt; // Нет = ни разу не обращались
    uint64_t sizeBytes = 0;
    uint64_t accessCount = 0;
    std::optional<nlohmann::json> metadata;

    nlohmann::json toJson() const;
    static IndexItem fromJson(const nlohmann::json& j);
};

// CacheIndex — содержимое cache-index.json
struct CacheIndex {
    std::string version = INDEX_VERSION;
    util::TimePoint createdAt;
    util::TimePoint updatedAt;
    uint64_t totalItems = 0;
    uint64_t totalSizeBytes = 0;
    std::vector<IndexItem> items;

    static CacheIndex fresh(util::TimePoint now);
    void recomputeTotals(); // totalItems/totalSizeBytes из items
    IndexItem* find(const std::string& hash);
    const IndexItem* find(const std::string& hash) const;

    nlohmann::json toJson() const;
    static CacheIndex fromJson(const nlohmann::json& j);
};

// FileHashRecord — "файл при последнем просмотре имел этот хэш, из него получены эти записи"
struct FileHashRecord {
    std::string filePath;
    std::string hash;
    util::TimePoint computedAt;
    std::vector<std::string> relatedCacheHashes;

    nlohmann::json toJson() const;
    static FileHashRecord fromJson(const nlohmann::json& j);
};

// HashRegistry — содержимое hash-registry.json, уникально по filePath
struct HashRegistry {
    std::string version = REGISTRY_VERSION;
    util::TimePoint updatedAt;
    std::vector<FileHashRecord> files;

    static HashRegistry fresh(util::TimePoint now);
    FileHashRecord* find(const std::string& filePath);

    nlohmann::json toJson() const;
    static HashRegistry fromJson(const nlohmann::json& j);
};

} // namespace cache
} // namespace core
} // namespace offcache
