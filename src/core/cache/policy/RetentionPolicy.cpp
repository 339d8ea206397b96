#include "core/cache/policy/RetentionPolicy.hpp"
#include "core/cache/policy/Eviction.hpp"
#include <utility>

namespace offcache {
namespace core {
namespace cache {

namespace {

std::string plural(int64_t count, const char* unit) {
    return std::to_string(count) + " " + unit + (count == 1 ? "" : "s");
}

} // namespace

RetentionPolicy::RetentionPolicy(std::shared_ptr<CacheContext> context,
                                 std::shared_ptr<PayloadStore> store,
                                 std::shared_ptr<CacheIndexManager> index)
    : context_(std::move(context)), store_(std::move(store)), index_(std::move(index)) {}

std::chrono::milliseconds RetentionPolicy::calculateAge(const IndexItem& item, util::TimePoint now) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - item.cachedAt);
}

std::string RetentionPolicy::formatAge(std::chrono::milliseconds age) {
    using namespace std::chrono;
    const auto days = duration_cast<hours>(age).count() / 24;
    if (days > 0) {
        return plural(days, "day");
    }
    const auto hrs = duration_cast<hours>(age).count();
    if (hrs > 0) {
        return plural(hrs, "hour");
    }
    return plural(duration_cast<minutes>(age).count(), "minute");
}

std::vector<IndexItem> RetentionPolicy::getExpiredItems(std::chrono::milliseconds maxAge) const {
    const auto now = context_->now();
    std::vector<IndexItem> expired;
    for (auto& item : index_->load().items) {
        if (calculateAge(item, now) > maxAge) {
            expired.push_back(std::move(item));
        }
    }
    return expired;
}

RetentionResult RetentionPolicy::applyRetentionPolicy(std::chrono::milliseconds maxAge) {
    RetentionResult result;
    const auto expired = getExpiredItems(maxAge);
    if (expired.empty()) {
        context_->log().debug("RetentionPolicy: просроченных записей нет");
        return result;
    }

    const auto now = context_->now();
    for (const auto& item : expired) {
        EvictionOutcome outcome = evictEntry(*store_, *index_, item.hash);
        if (!outcome.ok) {
            result.errors.push_back(outcome.error.value_or("Failed to evict " + item.hash));
            context_->log().warn("RetentionPolicy: не удалось удалить {}", item.hash);
            continue;
        }
        ++result.removedCount;
        result.bytesFreed += item.sizeBytes;
        context_->log().debug("RetentionPolicy: удалён {} (возраст {})",
                              item.hash, formatAge(calculateAge(item, now)));
    }

    result.success = result.errors.empty();
    context_->log().info("RetentionPolicy: удалено {} записей старше {}, освобождено {} байт",
                         result.removedCount, formatAge(maxAge), result.bytesFreed);
    return result;
}

} // namespace cache
} // namespace core
} // namespace offcache
