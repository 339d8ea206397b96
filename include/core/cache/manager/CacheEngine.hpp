#pragma once

#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "core/cache/CacheConfig.hpp"
#include "core/cache/CacheContext.hpp"
#include "core/cache/change/ChangeDetector.hpp"
#include "core/cache/index/CacheIndexManager.hpp"
#include "core/cache/metrics/CacheStats.hpp"
#include "core/cache/policy/RetentionPolicy.hpp"
#include "core/cache/policy/SizePruner.hpp"
#include "core/cache/policy/StalenessRefresher.hpp"
#include "core/cache/storage/PayloadStore.hpp"
#include "core/cache/structure/StructureManager.hpp"
#include "core/fs/FileSystem.hpp"
#include "core/thread/Scheduler.hpp"
#include "core/util/Clock.hpp"

namespace offcache {
namespace core {
namespace cache {

// MaintenanceReport — итог runMaintenance
struct MaintenanceReport {
    RetentionResult retention;
    PruneResult pruning;
    size_t tempFilesRemoved = 0;

    bool success() const { return retention.success && pruning.success; }
    nlohmann::json toJson() const;
};

// CacheEngine — один экземпляр каждого компонента над общим CacheContext.
// put = save + add в индекс, get = load + touch.
class CacheEngine {
public:
    // Бросает ConfigError при некорректной конфигурации
    explicit CacheEngine(const CacheConfig& config,
                         std::shared_ptr<fs::IFileSystem> fileSystem = nullptr,
                         std::shared_ptr<util::IClock> clock = nullptr,
                         std::shared_ptr<spdlog::logger> logger = nullptr);
    ~CacheEngine();
    CacheEngine(const CacheEngine&) = delete;
    CacheEngine& operator=(const CacheEngine&) = delete;

    StructureResult initialize(); // Каталоги + пустой индекс
    bool isInitialized() const;

    SaveResult put(const nlohmann::json& data,
                   const std::string& source,
                   const std::string& type,
                   const std::optional<nlohmann::json>& metadata = std::nullopt);
    LoadResult get(const std::string& hash);
    bool invalidate(const std::string& hash); // Удалить payload и запись индекса
    CacheStats stats() const;

    MaintenanceReport runMaintenance(); // Retention, затем LRU, затем temp
    ReconcileResult reconcile();

    // nullptr = ThreadScheduler
    bool startChangeDetection(std::shared_ptr<thread::IScheduler> scheduler = nullptr);
    void stopChangeDetection();
    bool isChangeDetectionActive() const;

    void shutdown();

    const CacheConfig& config() const;
    std::shared_ptr<CacheContext> context() const;
    StructureManager& structure();
    PayloadStore& store();
    CacheIndexManager& index();
    RetentionPolicy& retention();
    SizePruner& pruner();
    StalenessRefresher& refresher();
    ChangeDetector& changeDetector();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace cache
} // namespace core
} // namespace offcache
