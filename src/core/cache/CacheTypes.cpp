#include "core/cache/CacheTypes.hpp"
#include "core/util/Errors.hpp"
#include <algorithm>
#include <unordered_set>

namespace offcache {
namespace core {
namespace cache {

namespace {

util::TimePoint timeField(const nlohmann::json& j, const char* key) {
    auto text = j.at(key).get<std::string>();
    auto tp = util::parseIsoString(text);
    if (!tp) {
        throw CacheError(std::string("invalid timestamp in '") + key + "': " + text);
    }
    return *tp;
}

std::optional<nlohmann::json> metadataField(const nlohmann::json& j) {
    if (j.contains("metadata") && !j["metadata"].is_null()) {
        return j["metadata"];
    }
    return std::nullopt;
}

} // namespace

nlohmann::json CachedPayload::toJson() const {
    nlohmann::json j = {
        {"hash", hash},
        {"data", data},
        {"source", source},
        {"type", type},
        {"cachedAt", util::toIsoString(cachedAt)}
    };
    if (metadata) {
        j["metadata"] = *metadata;
    }
    return j;
}

CachedPayload CachedPayload::fromJson(const nlohmann::json& j) {
    CachedPayload payload;
    payload.hash = j.at("hash").get<std::string>();
    payload.data = j.contains("data") ? j["data"] : nlohmann::json();
    payload.source = j.at("source").get<std::string>();
    payload.type = j.at("type").get<std::string>();
    payload.cachedAt = timeField(j, "cachedAt");
    payload.metadata = metadataField(j);
    return payload;
}

nlohmann::json IndexItem::toJson() const {
    nlohmann::json j = {
        {"hash", hash},
        {"source", source},
        {"type", type},
        {"cachedAt", util::toIsoString(cachedAt)},
        {"sizeBytes", sizeBytes},
        {"accessCount", accessCount}
    };
    if (lastAccessedAt) {
        j["lastAccessedAt"] = util::toIsoString(*lastAccessedAt);
    }
    if (metadata) {
        j["metadata"] = *metadata;
    }
    return j;
}

IndexItem IndexItem::fromJson(const nlohmann::json& j) {
    IndexItem item;
    item.hash = j.at("hash").get<std::string>();
    item.source = j.value("source", std::string());
    item.type = j.value("type", std::string());
    item.cachedAt = timeField(j, "cachedAt");
    if (j.contains("lastAccessedAt") && !j["lastAccessedAt"].is_null()) {
        item.lastAccessedAt = timeField(j, "lastAccessedAt");
    }
    item.sizeBytes = j.value("sizeBytes", static_cast<uint64_t>(0));
    item.accessCount = j.value("accessCount", static_cast<uint64_t>(0));
    item.metadata = metadataField(j);
    return item;
}

CacheIndex CacheIndex::fresh(util::TimePoint now) {
    CacheIndex index;
    index.createdAt = now;
    index.updatedAt = now;
    return index;
}

void CacheIndex::recomputeTotals() {
    totalItems = items.size();
    totalSizeBytes = 0;
    for (const auto& item : items) {
        totalSizeBytes += item.sizeBytes;
    }
}

IndexItem* CacheIndex::find(const std::string& hash) {
    auto it = std::find_if(items.begin(), items.end(),
                           [&](const IndexItem& item) { return item.hash == hash; });
    return it == items.end() ? nullptr : &*it;
}

const IndexItem* CacheIndex::find(const std::string& hash) const {
    auto it = std::find_if(items.begin(), items.end(),
                           [&](const IndexItem& item) { return item.hash == hash; });
    return it == items.end() ? nullptr : &*it;
}

nlohmann::json CacheIndex::toJson() const {
    nlohmann::json itemsJson = nlohmann::json::array();
    for (const auto& item : items) {
        itemsJson.push_back(item.toJson());
    }
    return {
        {"version", version},
        {"createdAt", util::toIsoString(createdAt)},
        {"updatedAt", util::toIsoString(updatedAt)},
        {"totalItems", totalItems},
        {"totalSizeBytes", totalSizeBytes},
        {"items", itemsJson}
    };
}

CacheIndex CacheIndex::fromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("items") || !j["items"].is_array()) {
        throw CacheError("cache index: missing 'items' array");
    }
    CacheIndex index;
    index.version = j.value("version", std::string(INDEX_VERSION));
    index.createdAt = timeField(j, "createdAt");
    index.updatedAt = timeField(j, "updatedAt");
    std::unordered_set<std::string> seen;
    for (const auto& itemJson : j["items"]) {
        IndexItem item = IndexItem::fromJson(itemJson);
        // Хэши уникальны: при дублях оставляем первую запись
        if (seen.insert(item.hash).second) {
            index.items.push_back(std::move(item));
        }
    }
    index.recomputeTotals();
    return index;
}

nlohmann::json FileHashRecord::toJson() const {
    return {
        {"filePath", filePath},
        {"hash", hash},
        {"computedAt", util::toIsoString(computedAt)},
        {"relatedCacheHashes", relatedCacheHashes}
    };
}

FileHashRecord FileHashRecord::fromJson(const nlohmann::json& j) {
    FileHashRecord record;
    record.filePath = j.at("filePath").get<std::string>();
    record.hash = j.at("hash").get<std::string>();
    record.computedAt = timeField(j, "computedAt");
    record.relatedCacheHashes = j.value("relatedCacheHashes", std::vector<std::string>{});
    return record;
}

HashRegistry HashRegistry::fresh(util::TimePoint now) {
    HashRegistry registry;
    registry.updatedAt = now;
    return registry;
}

FileHashRecord* HashRegistry::find(const std::string& filePath) {
    auto it = std::find_if(files.begin(), files.end(),
                           [&](const FileHashRecord& record) { return record.filePath == filePath; });
    return it == files.end() ? nullptr : &*it;
}

nlohmann::json HashRegistry::toJson() const {
    nlohmann::json filesJson = nlohmann::json::array();
    for (const auto& record : files) {
        filesJson.push_back(record.toJson());
    }
    return {
        {"version", version},
        {"updatedAt", util::toIsoString(updatedAt)},
        {"files", filesJson}
    };
}

HashRegistry HashRegistry::fromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("files") || !j["files"].is_array()) {
        throw CacheError("hash registry: missing 'files' array");
    }
    HashRegistry registry;
    registry.version = j.value("version", std::string(REGISTRY_VERSION));
    registry.updatedAt = timeField(j, "updatedAt");
    for (const auto& recordJson : j["files"]) {
        FileHashRecord record = FileHashRecord::fromJson(recordJson);
        if (!registry.find(record.filePath)) {
            registry.files.push_back(std::move(record));
        }
    }
    return registry;
}

} // namespace cache
} // namespace core
} // namespace offcache
