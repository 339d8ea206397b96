#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/CacheConfig.hpp"
#include "core/cache/CacheContext.hpp"
#include "core/cache/change/ChangeDetector.hpp"
#include "core/cache/index/CacheIndexManager.hpp"
#include "core/cache/storage/PayloadStore.hpp"

namespace offcache {
namespace core {
namespace cache {

// Новые данные для записи; std::nullopt или исключение: неудача
using RefreshFunction = std::function<std::optional<nlohmann::json>(const IndexItem&)>;

struct RefreshItemResult {
    std::string hash;
    bool success = false;
    bool skipped = false;
    std::optional<std::string> newHash;
    std::optional<std::string> error;
};

struct RefreshResult {
    bool success = true;
    size_t itemsRefreshed = 0;
    size_t itemsFailed = 0;
    size_t itemsSkipped = 0;
    std::vector<RefreshItemResult> results;
};

// StalenessRefresher — выбор и порядок обновления устаревших записей.
// Сами данные получает колбэк вызывающей стороны. Если задан changeDetector,
// связи отслеживаемых файлов переносятся на обновлённую запись.
class StalenessRefresher {
public:
    StalenessRefresher(std::shared_ptr<CacheContext> context,
                       std::shared_ptr<PayloadStore> store,
                       std::shared_ptr<CacheIndexManager> index,
                       std::shared_ptr<ChangeDetector> changeDetector = nullptr);

    static bool isStale(const IndexItem& item, std::chrono::milliseconds threshold, util::TimePoint now);
    // accessCount*10 + свежесть (до 100) + компактность (до 50)
    static double calculateRefreshPriority(const IndexItem& item, util::TimePoint now);
    static std::vector<IndexItem> sortByRefreshPriority(std::vector<IndexItem> items, util::TimePoint now);

    std::vector<IndexItem> getStaleItems(std::chrono::milliseconds threshold = DEFAULT_STALENESS_MS) const;
    RefreshResult refreshStaleItems(std::chrono::milliseconds threshold,
                                    const RefreshFunction& refreshFn,
                                    size_t maxItems = 0); // 0 = без ограничения

private:
    RefreshItemResult refreshOne(const IndexItem& item, const RefreshFunction& refreshFn);

    std::shared_ptr<CacheContext> context_;
    std::shared_ptr<PayloadStore> store_;
    std::shared_ptr<CacheIndexManager> index_;
    std::shared_ptr<ChangeDetector> changeDetector_;
};

} // namespace cache
} // namespace core
} // namespace offcache
