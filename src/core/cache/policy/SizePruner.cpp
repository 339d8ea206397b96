#include "core/cache/policy/SizePruner.hpp"
#include "core/cache/policy/Eviction.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace offcache {
namespace core {
namespace cache {

namespace {

// Время последнего использования: lastAccessedAt, иначе cachedAt
bool lessRecentlyUsed(const IndexItem& a, const IndexItem& b) {
    const util::TimePoint usedA = a.lastAccessedAt.value_or(a.cachedAt);
    const util::TimePoint usedB = b.lastAccessedAt.value_or(b.cachedAt);
    if (usedA != usedB) {
        return usedA < usedB;
    }
    return a.cachedAt < b.cachedAt;
}

} // namespace

SizePruner::SizePruner(std::shared_ptr<CacheContext> context,
                       std::shared_ptr<PayloadStore> store,
                       std::shared_ptr<CacheIndexManager> index)
    : context_(std::move(context)), store_(std::move(store)), index_(std::move(index)) {}

CacheSizeInfo SizePruner::getCacheSizeInfo() const {
    const CacheIndex index = index_->load();
    CacheSizeInfo info;
    info.itemCount = index.items.size();
    for (const auto& item : index.items) {
        info.totalBytes += item.sizeBytes;
        if (!info.largestItem || item.sizeBytes > info.largestItem->sizeBytes) {
            info.largestItem = item;
        }
    }
    info.totalMB = std::round(static_cast<double>(info.totalBytes) / (1024.0 * 1024.0) * 100.0) / 100.0;
    if (info.itemCount > 0) {
        info.averageItemSize = info.totalBytes / info.itemCount;
    }
    return info;
}

std::vector<IndexItem> SizePruner::getPruneableItems(size_t minKeep) const {
    std::vector<IndexItem> items = index_->load().items;
    if (items.size() <= minKeep) {
        return {};
    }
    std::stable_sort(items.begin(), items.end(), lessRecentlyUsed);
    items.resize(items.size() - minKeep);
    return items;
}

PruneResult SizePruner::pruneCacheLRU(uint64_t thresholdBytes, size_t minKeep) {
    PruneResult result;
    result.threshold = thresholdBytes;
    result.currentSize = getCacheSizeInfo().totalBytes;

    if (result.currentSize <= thresholdBytes) {
        context_->log().debug("SizePruner: размер {} не превышает порог {}",
                              formatBytes(result.currentSize), formatBytes(thresholdBytes));
        return result;
    }

    context_->log().info("SizePruner: размер {} превышает порог {}, вытеснение",
                         formatBytes(result.currentSize), formatBytes(thresholdBytes));

    for (const auto& item : getPruneableItems(minKeep)) {
        if (result.currentSize <= thresholdBytes) {
            break;
        }
        EvictionOutcome outcome = evictEntry(*store_, *index_, item.hash);
        if (!outcome.ok) {
            result.errors.push_back(outcome.error.value_or("Failed to evict " + item.hash));
            continue;
        }
        ++result.removedCount;
        result.bytesFreed += item.sizeBytes;
        result.currentSize -= std::min(result.currentSize, item.sizeBytes);
    }

    if (result.currentSize > thresholdBytes) {
        context_->log().warn("SizePruner: порог {} не достигнут с учётом minKeep={} (осталось {})",
                             formatBytes(thresholdBytes), minKeep, formatBytes(result.currentSize));
    }
    result.success = result.errors.empty();
    context_->log().info("SizePruner: удалено {} записей, освобождено {}",
                         result.removedCount, formatBytes(result.bytesFreed));
    return result;
}

std::string SizePruner::formatBytes(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    if (bytes == 0) {
        return "0 B";
    }
    size_t unit = 0;
    double value = static_cast<double>(bytes);
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    std::string text(buffer);
    // 1.50 -> 1.5, 1.00 -> 1
    text.erase(text.find_last_not_of('0') + 1);
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text + " " + units[unit];
}

} // namespace cache
} // namespace core
} // namespace offcache
