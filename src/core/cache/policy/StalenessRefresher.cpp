#include "core/cache/policy/StalenessRefresher.hpp"
#include "core/cache/policy/Eviction.hpp"
#include <algorithm>
#include <utility>

namespace offcache {
namespace core {
namespace cache {

namespace {

constexpr double ACCESS_WEIGHT = 10.0;
constexpr double RECENCY_MAX = 100.0;
constexpr double RECENCY_PER_DAY = 10.0;
constexpr double SIZE_SCORE_MAX = 50.0;
constexpr double SIZE_PER_MB = 5.0;

} // namespace

StalenessRefresher::StalenessRefresher(std::shared_ptr<CacheContext> context,
                                       std::shared_ptr<PayloadStore> store,
                                       std::shared_ptr<CacheIndexManager> index,
                                       std::shared_ptr<ChangeDetector> changeDetector)
    : context_(std::move(context)), store_(std::move(store)), index_(std::move(index)),
      changeDetector_(std::move(changeDetector)) {}

bool StalenessRefresher::isStale(const IndexItem& item, std::chrono::milliseconds threshold, util::TimePoint now) {
    return now - item.cachedAt > threshold;
}

double StalenessRefresher::calculateRefreshPriority(const IndexItem& item, util::TimePoint now) {
    const util::TimePoint lastUsed = item.lastAccessedAt.value_or(item.cachedAt);
    const double days = std::chrono::duration<double, std::ratio<86400>>(now - lastUsed).count();
    const double sizeMB = static_cast<double>(item.sizeBytes) / (1024.0 * 1024.0);

    const double accessScore = static_cast<double>(item.accessCount) * ACCESS_WEIGHT;
    const double recencyScore = std::max(0.0, RECENCY_MAX - std::max(0.0, days) * RECENCY_PER_DAY);
    const double sizeScore = std::max(0.0, SIZE_SCORE_MAX - sizeMB * SIZE_PER_MB);
    return accessScore + recencyScore + sizeScore;
}

std::vector<IndexItem> StalenessRefresher::sortByRefreshPriority(std::vector<IndexItem> items, util::TimePoint now) {
    std::stable_sort(items.begin(), items.end(), [now](const IndexItem& a, const IndexItem& b) {
        return calculateRefreshPriority(a, now) > calculateRefreshPriority(b, now);
    });
    return items;
}

std::vector<IndexItem> StalenessRefresher::getStaleItems(std::chrono::milliseconds threshold) const {
    const auto now = context_->now();
    std::vector<IndexItem> stale;
    for (auto& item : index_->load().items) {
        if (isStale(item, threshold, now)) {
            stale.push_back(std::move(item));
        }
    }
    return stale;
}

RefreshResult StalenessRefresher::refreshStaleItems(std::chrono::milliseconds threshold,
                                                    const RefreshFunction& refreshFn,
                                                    size_t maxItems) {
    RefreshResult result;
    const auto ordered = sortByRefreshPriority(getStaleItems(threshold), context_->now());
    context_->log().info("StalenessRefresher: устаревших записей: {}", ordered.size());

    for (size_t i = 0; i < ordered.size(); ++i) {
        if (maxItems > 0 && i >= maxItems) {
            RefreshItemResult skipped;
            skipped.hash = ordered[i].hash;
            skipped.skipped = true;
            result.results.push_back(std::move(skipped));
            ++result.itemsSkipped;
            continue;
        }
        RefreshItemResult itemResult = refreshOne(ordered[i], refreshFn);
        if (itemResult.success) {
            ++result.itemsRefreshed;
        } else {
            ++result.itemsFailed;
        }
        result.results.push_back(std::move(itemResult));
    }

    result.success = result.itemsFailed == 0;
    context_->log().info("StalenessRefresher: обновлено {}, ошибок {}, пропущено {}",
                         result.itemsRefreshed, result.itemsFailed, result.itemsSkipped);
    return result;
}

RefreshItemResult StalenessRefresher::refreshOne(const IndexItem& item, const RefreshFunction& refreshFn) {
    RefreshItemResult itemResult;
    itemResult.hash = item.hash;

    std::optional<nlohmann::json> newData;
    try {
        newData = refreshFn(item);
    } catch (const std::exception& e) {
        itemResult.error = e.what();
        context_->log().warn("StalenessRefresher: колбэк для {} завершился ошибкой: {}", item.hash, e.what());
        return itemResult;
    } catch (...) {
        itemResult.error = "Refresh function threw a non-standard exception for " + item.hash;
        context_->log().warn("StalenessRefresher: колбэк для {} завершился неизвестной ошибкой", item.hash);
        return itemResult;
    }
    if (!newData) {
        itemResult.error = "Refresh function returned no data for " + item.hash;
        return itemResult;
    }

    SaveResult saved = store_->save(*newData, item.source, item.type,
                                    nlohmann::json{{"refreshedFrom", item.hash}});
    if (!saved.success) {
        itemResult.error = saved.error.value_or("Failed to save refreshed payload");
        return itemResult;
    }
    LoadResult loaded = store_->load(saved.hash);
    if (!loaded.success || !loaded.payload) {
        itemResult.error = loaded.error.value_or("Failed to read refreshed payload");
        return itemResult;
    }
    const int64_t size = store_->size(saved.hash);
    // Для того же хэша add засчитывается как обращение
    if (!index_->add(*loaded.payload, size < 0 ? 0 : static_cast<uint64_t>(size))) {
        itemResult.error = "Failed to index refreshed payload " + saved.hash;
        return itemResult;
    }

    if (saved.hash != item.hash) {
        EvictionOutcome outcome = evictEntry(*store_, *index_, item.hash);
        // Если старую запись удалить не удалось, отслеживаются обе
        if (changeDetector_ && !changeDetector_->replaceRelatedHash(item.hash, saved.hash, !outcome.ok)) {
            itemResult.newHash = saved.hash;
            itemResult.error = "Failed to relink tracked files to " + saved.hash;
            return itemResult;
        }
        if (!outcome.ok) {
            itemResult.newHash = saved.hash;
            itemResult.error = outcome.error;
            return itemResult;
        }
    }

    itemResult.success = true;
    itemResult.newHash = saved.hash;
    context_->log().debug("StalenessRefresher: {} обновлён -> {}", item.hash, saved.hash);
    return itemResult;
}

} // namespace cache
} // namespace core
} // namespace offcache
