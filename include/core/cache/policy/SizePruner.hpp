#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/cache/CacheConfig.hpp"
#include "core/cache/CacheContext.hpp"
#include "core/cache/index/CacheIndexManager.hpp"
#include "core/cache/storage/PayloadStore.hpp"

namespace offcache {
namespace core {
namespace cache {

// CacheSizeInfo — размер кэша по данным индекса
struct CacheSizeInfo {
    uint64_t totalBytes = 0;
    size_t itemCount = 0;
    double totalMB = 0.0;
    std::optional<IndexItem> largestItem;
    uint64_t averageItemSize = 0;
};

struct PruneResult {
    bool success = true;
    size_t removedCount = 0;
    uint64_t bytesFreed = 0;
    uint64_t currentSize = 0; // Размер после вытеснения
    uint64_t threshold = 0;
    std::vector<std::string> errors;
};

// SizePruner — вытеснение least-recently-used записей до порога размера
class SizePruner {
public:
    SizePruner(std::shared_ptr<CacheContext> context,
               std::shared_ptr<PayloadStore> store,
               std::shared_ptr<CacheIndexManager> index);

    CacheSizeInfo getCacheSizeInfo() const;
    // По возрастанию lastAccessedAt (без обращений: cachedAt), без minKeep самых свежих
    std::vector<IndexItem> getPruneableItems(size_t minKeep) const;
    PruneResult pruneCacheLRU(uint64_t thresholdBytes, size_t minKeep = MIN_ITEMS_TO_KEEP);

    static std::string formatBytes(uint64_t bytes); // "0 B", "1 KB", "1.5 MB"

private:
    std::shared_ptr<CacheContext> context_;
    std::shared_ptr<PayloadStore> store_;
    std::shared_ptr<CacheIndexManager> index_;
};

} // namespace cache
} // namespace core
} // namespace offcache
