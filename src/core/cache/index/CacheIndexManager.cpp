#include "core/cache/index/CacheIndexManager.hpp"
#include "core/cache/storage/PayloadStore.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <utility>

namespace offcache {
namespace core {
namespace cache {

namespace {

IndexItem itemFromPayload(const CachedPayload& payload, uint64_t sizeBytes) {
    IndexItem item;
    item.hash = payload.hash;
    item.source = payload.source;
    item.type = payload.type;
    item.cachedAt = payload.cachedAt;
    item.sizeBytes = sizeBytes;
    item.metadata = payload.metadata;
    return item;
}

bool matches(const IndexItem& item, const SearchFilter& filter) {
    if (filter.source && item.source != *filter.source) return false;
    if (filter.type && item.type != *filter.type) return false;
    if (filter.cachedAfter && item.cachedAt < *filter.cachedAfter) return false;
    if (filter.cachedBefore && item.cachedAt > *filter.cachedBefore) return false;
    if (filter.minSize && item.sizeBytes < *filter.minSize) return false;
    if (filter.maxSize && item.sizeBytes > *filter.maxSize) return false;
    return true;
}

} // namespace

CacheIndexManager::CacheIndexManager(std::shared_ptr<CacheContext> context)
    : context_(std::move(context)) {}

CacheIndex CacheIndexManager::load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loadUnlocked();
}

CacheIndex CacheIndexManager::loadUnlocked() const {
    const std::string& path = context_->paths.indexFile;
    auto& files = context_->files();
    try {
        if (!files.exists(path)) {
            return CacheIndex::fresh(context_->now());
        }
        return CacheIndex::fromJson(nlohmann::json::parse(files.readFile(path)));
    } catch (const std::exception& e) {
        // Повреждённый или нечитаемый индекс: начинаем с пустого
        context_->log().warn("CacheIndexManager: индекс {} повреждён, используется пустой: {}", path, e.what());
        return CacheIndex::fresh(context_->now());
    }
}

bool CacheIndexManager::save(CacheIndex& index) {
    std::lock_guard<std::mutex> lock(mutex_);
    return saveUnlocked(index);
}

bool CacheIndexManager::saveUnlocked(CacheIndex& index) {
    index.updatedAt = context_->now();
    index.recomputeTotals();
    try {
        context_->files().writeFile(context_->paths.indexFile, index.toJson().dump(2));
        return true;
    } catch (const std::exception& e) {
        context_->log().error("CacheIndexManager: ошибка записи индекса: {}", e.what());
        return false;
    }
}

bool CacheIndexManager::update(const std::function<bool(CacheIndex&)>& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheIndex index = loadUnlocked();
    if (!mutator(index)) {
        return false;
    }
    return saveUnlocked(index);
}

bool CacheIndexManager::add(const CachedPayload& payload, uint64_t sizeBytes) {
    const bool saved = update([&](CacheIndex& index) {
        if (IndexItem* existing = index.find(payload.hash)) {
            existing->source = payload.source;
            existing->type = payload.type;
            existing->sizeBytes = sizeBytes;
            existing->lastAccessedAt = context_->now();
            existing->accessCount += 1;
            if (payload.metadata) {
                existing->metadata = payload.metadata;
            }
            return true;
        }
        IndexItem item = itemFromPayload(payload, sizeBytes);
        item.accessCount = 1;
        index.items.push_back(std::move(item));
        return true;
    });
    if (saved) {
        context_->log().debug("CacheIndexManager: добавлен {} ({} байт)", payload.hash, sizeBytes);
    }
    return saved;
}

bool CacheIndexManager::remove(const std::string& hash) {
    return update([&](CacheIndex& index) {
        const auto before = index.items.size();
        index.items.erase(std::remove_if(index.items.begin(), index.items.end(),
                                         [&](const IndexItem& item) { return item.hash == hash; }),
                          index.items.end());
        return index.items.size() != before;
    });
}

std::vector<IndexItem> CacheIndexManager::search(const SearchFilter& filter) const {
    std::vector<IndexItem> found;
    for (auto& item : load().items) {
        if (matches(item, filter)) {
            found.push_back(std::move(item));
        }
    }
    return found;
}

std::optional<IndexItem> CacheIndexManager::getItem(const std::string& hash) const {
    const CacheIndex index = load();
    if (const IndexItem* item = index.find(hash)) {
        return *item;
    }
    return std::nullopt;
}

bool CacheIndexManager::touch(const std::string& hash) {
    return update([&](CacheIndex& index) {
        IndexItem* item = index.find(hash);
        if (!item) {
            return false;
        }
        item->lastAccessedAt = context_->now();
        item->accessCount += 1;
        return true;
    });
}

CacheStats CacheIndexManager::stats() const {
    const CacheIndex index = load();
    CacheStats stats;
    stats.totalItems = index.items.size();

    const IndexItem* oldest = nullptr;
    const IndexItem* newest = nullptr;
    for (const auto& item : index.items) {
        stats.totalSizeBytes += item.sizeBytes;
        stats.bySource[item.source] += 1;
        stats.byType[item.type] += 1;
        if (!oldest || item.cachedAt < oldest->cachedAt) oldest = &item;
        if (!newest || item.cachedAt > newest->cachedAt) newest = &item;
    }
    stats.totalSizeMB = std::round(static_cast<double>(stats.totalSizeBytes) / (1024.0 * 1024.0) * 100.0) / 100.0;
    if (oldest) stats.oldestItem = util::toIsoString(oldest->cachedAt);
    if (newest) stats.newestItem = util::toIsoString(newest->cachedAt);
    return stats;
}

ReconcileResult CacheIndexManager::reconcile(const PayloadStore& store) {
    ReconcileResult result;
    std::lock_guard<std::mutex> lock(mutex_);
    CacheIndex index = loadUnlocked();

    // Записи без файла
    std::vector<IndexItem> kept;
    kept.reserve(index.items.size());
    for (auto& item : index.items) {
        const int64_t size = store.size(item.hash);
        if (size < 0) {
            context_->log().info("CacheIndexManager: запись {} без файла удалена", item.hash);
            ++result.removedOrphans;
            continue;
        }
        if (static_cast<uint64_t>(size) != item.sizeBytes) {
            item.sizeBytes = static_cast<uint64_t>(size);
            ++result.sizesCorrected;
        }
        kept.push_back(std::move(item));
    }
    index.items = std::move(kept);

    // Файлы без записи
    std::unordered_set<std::string> known;
    for (const auto& item : index.items) {
        known.insert(item.hash);
    }
    for (const auto& hash : store.listAll()) {
        if (known.count(hash)) {
            continue;
        }
        LoadResult loaded = store.load(hash);
        if (!loaded.success || !loaded.payload) {
            result.errors.push_back("Failed to index " + hash + ": " + loaded.error.value_or("unknown error"));
            continue;
        }
        const int64_t size = store.size(hash);
        index.items.push_back(itemFromPayload(*loaded.payload, size < 0 ? 0 : static_cast<uint64_t>(size)));
        ++result.addedMissing;
    }

    if (result.removedOrphans + result.addedMissing + result.sizesCorrected > 0) {
        if (!saveUnlocked(index)) {
            result.errors.push_back("Failed to save cache index");
        }
        context_->log().info("CacheIndexManager: сверка: удалено {}, добавлено {}, исправлено размеров {}",
                             result.removedOrphans, result.addedMissing, result.sizesCorrected);
    }
    result.success = result.errors.empty();
    return result;
}

} // namespace cache
} // namespace core
} // namespace offcache
