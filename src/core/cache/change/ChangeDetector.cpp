#include "core/cache/change/ChangeDetector.hpp"
#include "core/cache/policy/Eviction.hpp"
#include "core/util/Hash.hpp"
#include <algorithm>
#include <utility>

namespace offcache {
namespace core {
namespace cache {

namespace {

void appendUnique(std::vector<std::string>& target, const std::vector<std::string>& values) {
    for (const auto& value : values) {
        if (std::find(target.begin(), target.end(), value) == target.end()) {
            target.push_back(value);
        }
    }
}

// Сбрасывает флаг выполняемой проверки при любом выходе
class InFlightReset {
public:
    explicit InFlightReset(std::atomic<bool>& flag) : flag_(flag) {}
    ~InFlightReset() { flag_.store(false); }
    InFlightReset(const InFlightReset&) = delete;
    InFlightReset& operator=(const InFlightReset&) = delete;
private:
    std::atomic<bool>& flag_;
};

} // namespace

ChangeDetector::ChangeDetector(std::shared_ptr<CacheContext> context,
                               std::shared_ptr<PayloadStore> store,
                               std::shared_ptr<CacheIndexManager> index)
    : context_(std::move(context)), store_(std::move(store)), index_(std::move(index)) {}

std::optional<std::string> ChangeDetector::computeFileHash(const std::string& filePath) const {
    try {
        return util::sha256Hex(context_->files().readFile(filePath));
    } catch (const std::exception& e) {
        context_->log().debug("ChangeDetector: не удалось вычислить хэш {}: {}", filePath, e.what());
        return std::nullopt;
    }
}

HashRegistry ChangeDetector::loadRegistry() const {
    std::lock_guard<std::mutex> lock(registryMutex_);
    return loadRegistryUnlocked();
}

HashRegistry ChangeDetector::loadRegistryUnlocked() const {
    const std::string& path = context_->paths.registryFile;
    try {
        if (!context_->files().exists(path)) {
            return HashRegistry::fresh(context_->now());
        }
        return HashRegistry::fromJson(nlohmann::json::parse(context_->files().readFile(path)));
    } catch (const std::exception& e) {
        context_->log().warn("ChangeDetector: реестр {} повреждён, используется пустой: {}", path, e.what());
        return HashRegistry::fresh(context_->now());
    }
}

bool ChangeDetector::saveRegistry(HashRegistry& registry) {
    std::lock_guard<std::mutex> lock(registryMutex_);
    return saveRegistryUnlocked(registry);
}

bool ChangeDetector::saveRegistryUnlocked(HashRegistry& registry) {
    registry.updatedAt = context_->now();
    try {
        context_->files().writeFile(context_->paths.registryFile, registry.toJson().dump(2));
        return true;
    } catch (const std::exception& e) {
        context_->log().error("ChangeDetector: ошибка записи реестра: {}", e.what());
        return false;
    }
}

bool ChangeDetector::registerFile(const std::string& filePath, const std::vector<std::string>& relatedCacheHashes) {
    const auto hash = computeFileHash(filePath);
    if (!hash) {
        context_->log().warn("ChangeDetector: файл {} не зарегистрирован: хэш недоступен", filePath);
        return false;
    }

    std::lock_guard<std::mutex> lock(registryMutex_);
    HashRegistry registry = loadRegistryUnlocked();
    if (FileHashRecord* record = registry.find(filePath)) {
        record->hash = *hash;
        record->computedAt = context_->now();
        appendUnique(record->relatedCacheHashes, relatedCacheHashes);
    } else {
        FileHashRecord created;
        created.filePath = filePath;
        created.hash = *hash;
        created.computedAt = context_->now();
        appendUnique(created.relatedCacheHashes, relatedCacheHashes);
        registry.files.push_back(std::move(created));
    }

    if (!saveRegistryUnlocked(registry)) {
        return false;
    }
    context_->log().info("ChangeDetector: отслеживается {} ({} записей кэша)", filePath, relatedCacheHashes.size());
    return true;
}

DetectionResult ChangeDetector::detectAndInvalidateChanges() {
    DetectionResult result;
    std::lock_guard<std::mutex> lock(registryMutex_);
    HashRegistry registry = loadRegistryUnlocked();
    bool registryChanged = false;

    for (auto& record : registry.files) {
        ++result.filesScanned;

        bool missing = false;
        try {
            missing = !context_->files().exists(record.filePath);
        } catch (const std::exception& e) {
            result.errors.push_back("Failed to check " + record.filePath + ": " + e.what());
            continue;
        }

        std::optional<std::string> currentHash;
        if (!missing) {
            currentHash = computeFileHash(record.filePath);
            if (!currentHash) {
                result.errors.push_back("Failed to hash " + record.filePath);
                continue;
            }
            if (*currentHash == record.hash) {
                continue;
            }
        }

        ++result.filesChanged;
        context_->log().info("ChangeDetector: {} {}, инвалидация {} записей", record.filePath,
                             missing ? "удалён" : "изменён", record.relatedCacheHashes.size());

        for (const auto& cacheHash : record.relatedCacheHashes) {
            EvictionOutcome outcome = evictEntry(*store_, *index_, cacheHash);
            if (!outcome.ok) {
                result.errors.push_back(outcome.error.value_or("Failed to invalidate " + cacheHash));
                continue;
            }
            if (outcome.removedAnything()) {
                ++result.cacheEntriesInvalidated;
            }
        }

        // Пропавший файл остаётся с прежним хэшем до untrackFile
        if (currentHash) {
            record.hash = *currentHash;
            record.computedAt = context_->now();
            registryChanged = true;
        }
    }

    if (registryChanged && !saveRegistryUnlocked(registry)) {
        result.errors.push_back("Failed to save hash registry");
    }

    result.success = result.errors.empty();
    if (result.filesChanged > 0 || !result.success) {
        context_->log().info("ChangeDetector: проверено {}, изменено {}, инвалидировано {}, ошибок {}",
                             result.filesScanned, result.filesChanged,
                             result.cacheEntriesInvalidated, result.errors.size());
    }
    return result;
}

std::vector<FileHashRecord> ChangeDetector::getTrackedFiles() const {
    return loadRegistry().files;
}

bool ChangeDetector::untrackFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(registryMutex_);
    HashRegistry registry = loadRegistryUnlocked();
    auto it = std::find_if(registry.files.begin(), registry.files.end(),
                           [&](const FileHashRecord& record) { return record.filePath == filePath; });
    if (it == registry.files.end()) {
        return false;
    }
    registry.files.erase(it);
    if (!saveRegistryUnlocked(registry)) {
        return false;
    }
    context_->log().info("ChangeDetector: {} больше не отслеживается", filePath);
    return true;
}

bool ChangeDetector::replaceRelatedHash(const std::string& oldHash, const std::string& newHash, bool keepOld) {
    std::lock_guard<std::mutex> lock(registryMutex_);
    HashRegistry registry = loadRegistryUnlocked();
    size_t updated = 0;
    for (auto& record : registry.files) {
        auto& related = record.relatedCacheHashes;
        auto it = std::find(related.begin(), related.end(), oldHash);
        if (it == related.end()) {
            continue;
        }
        if (!keepOld) {
            related.erase(it);
        }
        appendUnique(related, {newHash});
        ++updated;
    }
    if (updated == 0) {
        return true;
    }
    if (!saveRegistryUnlocked(registry)) {
        return false;
    }
    context_->log().debug("ChangeDetector: {} -> {} в {} записях реестра", oldHash, newHash, updated);
    return true;
}

void ChangeDetector::runScheduledPass() {
    bool expected = false;
    if (!detectionInFlight_.compare_exchange_strong(expected, true)) {
        ++skippedTicks_;
        context_->log().debug("ChangeDetector: предыдущая проверка ещё идёт, tick пропущен");
        return;
    }
    InFlightReset reset(detectionInFlight_);
    try {
        detectAndInvalidateChanges();
    } catch (const std::exception& e) {
        context_->log().error("ChangeDetector: ошибка плановой проверки: {}", e.what());
    }
}

thread::ScheduleHandle ChangeDetector::scheduleChangeDetection(std::shared_ptr<thread::IScheduler> scheduler,
                                                               std::chrono::milliseconds interval) {
    runScheduledPass();
    if (!scheduler->start(interval, [this] { runScheduledPass(); })) {
        context_->log().warn("ChangeDetector: планировщик уже запущен");
    } else {
        context_->log().info("ChangeDetector: проверка изменений каждые {} мс", interval.count());
    }
    return thread::ScheduleHandle(std::move(scheduler));
}

} // namespace cache
} // namespace core
} // namespace offcache
