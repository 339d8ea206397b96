#include "core/cache/manager/CacheEngine.hpp"
#include "core/cache/policy/Eviction.hpp"
#include "core/util/Errors.hpp"
#include <atomic>
#include <mutex>

namespace offcache {
namespace core {
namespace cache {

nlohmann::json MaintenanceReport::toJson() const {
    return {
        {"retention", {
            {"success", retention.success},
            {"removedCount", retention.removedCount},
            {"bytesFreed", retention.bytesFreed},
            {"errors", retention.errors}
        }},
        {"pruning", {
            {"success", pruning.success},
            {"removedCount", pruning.removedCount},
            {"bytesFreed", pruning.bytesFreed},
            {"currentSize", pruning.currentSize},
            {"threshold", pruning.threshold},
            {"errors", pruning.errors}
        }},
        {"tempFilesRemoved", tempFilesRemoved}
    };
}

// Реализация PIMPL
struct CacheEngine::Impl {
    CacheConfig config;
    std::shared_ptr<CacheContext> context;
    std::unique_ptr<StructureManager> structure;
    std::shared_ptr<PayloadStore> store;
    std::shared_ptr<CacheIndexManager> index;
    std::unique_ptr<RetentionPolicy> retention;
    std::unique_ptr<SizePruner> pruner;
    std::shared_ptr<ChangeDetector> changeDetector;
    std::unique_ptr<StalenessRefresher> refresher;
    thread::ScheduleHandle detectionHandle;
    std::mutex detectionMutex;
    std::atomic<bool> initialized{false};

    Impl(const CacheConfig& cfg,
         std::shared_ptr<fs::IFileSystem> fileSystem,
         std::shared_ptr<util::IClock> clock,
         std::shared_ptr<spdlog::logger> logger)
        : config(cfg) {
        context = CacheContext::create(config.rootPath, std::move(fileSystem), std::move(clock), std::move(logger));
        structure = std::make_unique<StructureManager>(context);
        store = std::make_shared<PayloadStore>(context);
        index = std::make_shared<CacheIndexManager>(context);
        retention = std::make_unique<RetentionPolicy>(context, store, index);
        pruner = std::make_unique<SizePruner>(context, store, index);
        changeDetector = std::make_shared<ChangeDetector>(context, store, index);
        refresher = std::make_unique<StalenessRefresher>(context, store, index, changeDetector);
    }
};

CacheEngine::CacheEngine(const CacheConfig& config,
                         std::shared_ptr<fs::IFileSystem> fileSystem,
                         std::shared_ptr<util::IClock> clock,
                         std::shared_ptr<spdlog::logger> logger) {
    if (!config.validate()) {
        throw ConfigError("invalid cache configuration (root: '" + config.rootPath + "')");
    }
    pImpl = std::make_unique<Impl>(config, std::move(fileSystem), std::move(clock), std::move(logger));
    pImpl->context->log().info("CacheEngine: создан (root={}, retention={} мс, threshold={} байт)",
                               config.rootPath, config.retentionPeriod.count(), config.sizeThresholdBytes);
}

CacheEngine::~CacheEngine() {
    shutdown();
}

StructureResult CacheEngine::initialize() {
    StructureResult result = pImpl->structure->initializeStructure();
    pImpl->initialized = result.success;
    return result;
}

bool CacheEngine::isInitialized() const {
    return pImpl->initialized;
}

SaveResult CacheEngine::put(const nlohmann::json& data,
                            const std::string& source,
                            const std::string& type,
                            const std::optional<nlohmann::json>& metadata) {
    SaveResult result = pImpl->store->save(data, source, type, metadata);
    if (!result.success) {
        return result;
    }
    // При дедупликации в индекс попадает уже сохранённый payload
    LoadResult stored = pImpl->store->load(result.hash);
    const int64_t size = pImpl->store->size(result.hash);
    if (!stored.success || !stored.payload || size < 0 ||
        !pImpl->index->add(*stored.payload, static_cast<uint64_t>(size))) {
        result.success = false;
        result.error = "Payload " + result.hash + " saved but not indexed";
        pImpl->context->log().error("CacheEngine: {}", *result.error);
    }
    return result;
}

LoadResult CacheEngine::get(const std::string& hash) {
    LoadResult result = pImpl->store->load(hash);
    if (result.success && !pImpl->index->touch(hash)) {
        pImpl->context->log().debug("CacheEngine: payload {} отсутствует в индексе", hash);
    }
    return result;
}

bool CacheEngine::invalidate(const std::string& hash) {
    EvictionOutcome outcome = evictEntry(*pImpl->store, *pImpl->index, hash);
    return outcome.ok && outcome.removedAnything();
}

CacheStats CacheEngine::stats() const {
    return pImpl->index->stats();
}

MaintenanceReport CacheEngine::runMaintenance() {
    MaintenanceReport report;
    const CacheConfig& cfg = pImpl->config;
    report.retention = pImpl->retention->applyRetentionPolicy(cfg.retentionPeriod);
    report.pruning = pImpl->pruner->pruneCacheLRU(cfg.sizeThresholdBytes, cfg.minItemsToKeep);
    report.tempFilesRemoved = pImpl->structure->cleanupTempFiles(cfg.tempMaxAge);
    pImpl->context->log().info("CacheEngine: обслуживание завершено (retention={}, LRU={}, temp={})",
                               report.retention.removedCount, report.pruning.removedCount,
                               report.tempFilesRemoved);
    return report;
}

ReconcileResult CacheEngine::reconcile() {
    return pImpl->index->reconcile(*pImpl->store);
}

bool CacheEngine::startChangeDetection(std::shared_ptr<thread::IScheduler> scheduler) {
    std::lock_guard<std::mutex> lock(pImpl->detectionMutex);
    if (pImpl->detectionHandle.isActive()) {
        pImpl->context->log().warn("CacheEngine: проверка изменений уже запущена");
        return false;
    }
    if (!scheduler) {
        scheduler = std::make_shared<thread::ThreadScheduler>(pImpl->context->logger);
    }
    pImpl->detectionHandle = pImpl->changeDetector->scheduleChangeDetection(
        std::move(scheduler), pImpl->config.changeDetectionInterval);
    return pImpl->detectionHandle.isActive();
}

void CacheEngine::stopChangeDetection() {
    std::lock_guard<std::mutex> lock(pImpl->detectionMutex);
    pImpl->detectionHandle.cancel();
}

bool CacheEngine::isChangeDetectionActive() const {
    return pImpl->detectionHandle.isActive();
}

void CacheEngine::shutdown() {
    if (!pImpl) {
        return;
    }
    stopChangeDetection();
}

const CacheConfig& CacheEngine::config() const { return pImpl->config; }
std::shared_ptr<CacheContext> CacheEngine::context() const { return pImpl->context; }
StructureManager& CacheEngine::structure() { return *pImpl->structure; }
PayloadStore& CacheEngine::store() { return *pImpl->store; }
CacheIndexManager& CacheEngine::index() { return *pImpl->index; }
RetentionPolicy& CacheEngine::retention() { return *pImpl->retention; }
SizePruner& CacheEngine::pruner() { return *pImpl->pruner; }
StalenessRefresher& CacheEngine::refresher() { return *pImpl->refresher; }
ChangeDetector& CacheEngine::changeDetector() { return *pImpl->changeDetector; }

} // namespace cache
} // namespace core
} // namespace offcache
