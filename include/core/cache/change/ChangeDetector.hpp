#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/cache/CacheConfig.hpp"
#include "core/cache/CacheContext.hpp"
#include "core/cache/CacheTypes.hpp"
#include "core/cache/index/CacheIndexManager.hpp"
#include "core/cache/storage/PayloadStore.hpp"
#include "core/thread/Scheduler.hpp"

namespace offcache {
namespace core {
namespace cache {

struct DetectionResult {
    bool success = true;
    size_t filesScanned = 0;
    size_t filesChanged = 0;          // Изменённые или пропавшие файлы
    size_t cacheEntriesInvalidated = 0;
    std::vector<std::string> errors;
};

// ChangeDetector — отслеживает хэши исходных файлов (hash-registry.json)
// и инвалидирует записи кэша, полученные из изменившихся файлов.
class ChangeDetector {
public:
    ChangeDetector(std::shared_ptr<CacheContext> context,
                   std::shared_ptr<PayloadStore> store,
                   std::shared_ptr<CacheIndexManager> index);

    std::optional<std::string> computeFileHash(const std::string& filePath) const; // nullopt при ошибке чтения
    HashRegistry loadRegistry() const; // При отсутствии/повреждении: пустой реестр
    bool saveRegistry(HashRegistry& registry);

    bool registerFile(const std::string& filePath, const std::vector<std::string>& relatedCacheHashes);
    DetectionResult detectAndInvalidateChanges();
    std::vector<FileHashRecord> getTrackedFiles() const;
    bool untrackFile(const std::string& filePath); // false, если файл не отслеживается

    // Переносит связь файлов со старой записи кэша на новую (после обновления данных).
    // keepOld оставляет старый хэш рядом с новым. false только при ошибке записи реестра.
    bool replaceRelatedHash(const std::string& oldHash, const std::string& newHash, bool keepOld = false);

    // Один проход сразу, затем по интервалу; перекрывающиеся tick пропускаются
    thread::ScheduleHandle scheduleChangeDetection(std::shared_ptr<thread::IScheduler> scheduler,
                                                   std::chrono::milliseconds interval = DEFAULT_CHANGE_DETECTION_MS);
    uint64_t skippedTicks() const { return skippedTicks_.load(); }

private:
    HashRegistry loadRegistryUnlocked() const;
    bool saveRegistryUnlocked(HashRegistry& registry);
    void runScheduledPass();

    std::shared_ptr<CacheContext> context_;
    std::shared_ptr<PayloadStore> store_;
    std::shared_ptr<CacheIndexManager> index_;
    mutable std::mutex registryMutex_;
    std::atomic<bool> detectionInFlight_{false};
    std::atomic<uint64_t> skippedTicks_{0};
};

} // namespace cache
} // namespace core
} // namespace offcache
