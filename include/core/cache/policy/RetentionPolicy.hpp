#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "core/cache/CacheConfig.hpp"
#include "core/cache/CacheContext.hpp"
#include "core/cache/index/CacheIndexManager.hpp"
#include "core/cache/storage/PayloadStore.hpp"

namespace offcache {
namespace core {
namespace cache {

struct RetentionResult {
    bool success = true;
    size_t removedCount = 0;
    uint64_t bytesFreed = 0;
    std::vector<std::string> errors;
};

// RetentionPolicy — удаление записей старше заданного возраста (по cachedAt)
class RetentionPolicy {
public:
    RetentionPolicy(std::shared_ptr<CacheContext> context,
                    std::shared_ptr<PayloadStore> store,
                    std::shared_ptr<CacheIndexManager> index);

    static std::chrono::milliseconds calculateAge(const IndexItem& item, util::TimePoint now);
    static std::string formatAge(std::chrono::milliseconds age); // "3 days", "1 hour", "5 minutes"

    std::vector<IndexItem> getExpiredItems(std::chrono::milliseconds maxAge) const;
    RetentionResult applyRetentionPolicy(std::chrono::milliseconds maxAge = DEFAULT_RETENTION_MS);

private:
    std::shared_ptr<CacheContext> context_;
    std::shared_ptr<PayloadStore> store_;
    std::shared_ptr<CacheIndexManager> index_;
};

} // namespace cache
} // namespace core
} // namespace offcache
