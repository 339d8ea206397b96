#include "core/cache/policy/Eviction.hpp"

namespace offcache {
namespace core {
namespace cache {

EvictionOutcome evictEntry(PayloadStore& store, CacheIndexManager& index, const std::string& hash) {
    EvictionOutcome outcome;
    const DeleteStatus status = store.removeWithStatus(hash);
    if (status == DeleteStatus::Failed) {
        outcome.error = "Failed to delete payload " + hash;
        return outcome;
    }
    outcome.payloadRemoved = status == DeleteStatus::Deleted;
    outcome.indexRemoved = index.remove(hash);
    if (!outcome.indexRemoved && index.getItem(hash)) {
        outcome.error = "Failed to remove " + hash + " from cache index";
        return outcome;
    }
    outcome.ok = true;
    return outcome;
}

} // namespace cache
} // namespace core
} // namespace offcache
