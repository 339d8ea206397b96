#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include "core/cache/change/ChangeDetector.hpp"
#include "core/cache/index/CacheIndexManager.hpp"
#include "core/cache/storage/PayloadStore.hpp"
#include "core/cache/structure/StructureManager.hpp"
#include "core/fs/MemoryFileSystem.hpp"
#include "core/util/Hash.hpp"
#include "core/thread/Scheduler.hpp"

using namespace offcache::core;
using std::chrono::milliseconds;

namespace {

// Файловая система, вызывающая хук при чтении
class HookedFileSystem : public fs::MemoryFileSystem {
public:
    using fs::MemoryFileSystem::MemoryFileSystem;
    std::string readFile(const std::string& path) const override {
        if (onRead) {
            auto hook = onRead;
            onRead = nullptr;
            hook();
        }
        return fs::MemoryFileSystem::readFile(path);
    }
    mutable std::function<void()> onRead;
};

// Планировщик, отдающий tick тесту
class CapturingScheduler : public thread::IScheduler {
public:
    bool start(milliseconds, thread::Tick t) override {
        tick = std::move(t);
        running = true;
        return true;
    }
    void stop() override { running = false; }
    bool isRunning() const override { return running; }
    thread::Tick tick;
    bool running = false;
};

const std::string SOURCE_FILE = "/project/src/input.txt";

struct Fixture {
    std::shared_ptr<util::ManualClock> clock =
        std::make_shared<util::ManualClock>(*util::parseIsoString("2026-01-01T00:00:00.000Z"));
    std::shared_ptr<HookedFileSystem> files = std::make_shared<HookedFileSystem>(clock);
    std::shared_ptr<cache::CacheContext> context = cache::CacheContext::create("/cache", files, clock);
    std::shared_ptr<cache::PayloadStore> store = std::make_shared<cache::PayloadStore>(context);
    std::shared_ptr<cache::CacheIndexManager> index = std::make_shared<cache::CacheIndexManager>(context);
    cache::ChangeDetector detector{context, store, index};

    Fixture() {
        cache::StructureManager(context).initializeStructure();
        files->createDirectories("/project/src");
        files->writeFile(SOURCE_FILE, "version 1");
    }

    std::string put(const nlohmann::json& data) {
        auto saved = store->save(data, "user", "derived");
        auto loaded = store->load(saved.hash);
        index->add(*loaded.payload, static_cast<uint64_t>(store->size(saved.hash)));
        return saved.hash;
    }
};

} // namespace

void testComputeFileHash() {
    std::cout << "Testing ChangeDetector::computeFileHash...\n";
    Fixture f;
    auto hash = f.detector.computeFileHash(SOURCE_FILE);
    assert(hash.has_value());
    assert(*hash == util::sha256Hex(std::string("version 1")));
    assert(!f.detector.computeFileHash("/project/missing.txt").has_value());
    std::cout << "[OK] ChangeDetector::computeFileHash\n";
}

void testRegisterFile() {
    std::cout << "Testing ChangeDetector::registerFile...\n";
    Fixture f;
    assert(!f.detector.registerFile("/project/missing.txt", {"h1"}));
    assert(f.detector.getTrackedFiles().empty());

    assert(f.detector.registerFile(SOURCE_FILE, {"h1", "h1", "h2"}));
    auto tracked = f.detector.getTrackedFiles();
    assert(tracked.size() == 1);
    assert(tracked[0].relatedCacheHashes.size() == 2);
    assert(tracked[0].hash == util::sha256Hex(std::string("version 1")));

    // Повторная регистрация: тот же файл, хэши объединяются
    assert(f.detector.registerFile(SOURCE_FILE, {"h2", "h3"}));
    tracked = f.detector.getTrackedFiles();
    assert(tracked.size() == 1);
    assert(tracked[0].relatedCacheHashes.size() == 3);

    auto onDisk = nlohmann::json::parse(f.files->readFile(f.context->paths.registryFile));
    assert(onDisk["version"] == "1.0.0");
    assert(onDisk["files"].size() == 1);
    std::cout << "[OK] ChangeDetector::registerFile\n";
}

void testCorruptRegistry() {
    std::cout << "Testing ChangeDetector corrupt registry...\n";
    Fixture f;
    f.files->writeFile(f.context->paths.registryFile, "][ not json");
    auto registry = f.detector.loadRegistry();
    assert(registry.files.empty());
    assert(f.detector.registerFile(SOURCE_FILE, {"h1"}));
    assert(f.detector.getTrackedFiles().size() == 1);
    std::cout << "[OK] ChangeDetector corrupt registry\n";
}

void testChangeTriggeredInvalidation() {
    std::cout << "Testing change-triggered invalidation...\n";
    Fixture f;
    const auto derived = f.put({{"summary", "of version 1"}});
    const auto unrelated = f.put({{"other", true}});
    assert(f.detector.registerFile(SOURCE_FILE, {derived}));

    auto unchanged = f.detector.detectAndInvalidateChanges();
    assert(unchanged.success);
    assert(unchanged.filesScanned == 1);
    assert(unchanged.filesChanged == 0);
    assert(unchanged.cacheEntriesInvalidated == 0);

    f.clock->advance(milliseconds(1000));
    f.files->writeFile(SOURCE_FILE, "version 2");
    auto changed = f.detector.detectAndInvalidateChanges();
    assert(changed.success);
    assert(changed.filesChanged == 1);
    assert(changed.cacheEntriesInvalidated == 1);
    assert(f.store->load(derived).status == cache::LoadStatus::NotFound);
    assert(!f.index->getItem(derived).has_value());
    assert(f.index->getItem(unrelated).has_value());

    auto record = f.detector.getTrackedFiles()[0];
    assert(record.hash == util::sha256Hex(std::string("version 2")));
    assert(record.computedAt == f.clock->now());

    // Новый хэш сохранён: повторный проход ничего не находит
    auto again = f.detector.detectAndInvalidateChanges();
    assert(again.filesChanged == 0);
    std::cout << "[OK] change-triggered invalidation\n";
}

void testMissingTrackedFile() {
    std::cout << "Testing missing tracked file...\n";
    Fixture f;
    const auto derived = f.put("derived from input");
    assert(f.detector.registerFile(SOURCE_FILE, {derived}));
    const auto originalHash = f.detector.getTrackedFiles()[0].hash;

    assert(f.files->removeFile(SOURCE_FILE));
    auto result = f.detector.detectAndInvalidateChanges();
    assert(result.success);
    assert(result.filesChanged == 1);
    assert(result.cacheEntriesInvalidated == 1);
    assert(!f.store->exists(derived));
    assert(!f.index->getItem(derived).has_value());

    // Запись остаётся с прежним хэшем до untrackFile
    auto tracked = f.detector.getTrackedFiles();
    assert(tracked.size() == 1 && tracked[0].hash == originalHash);
    auto again = f.detector.detectAndInvalidateChanges();
    assert(again.filesChanged == 1);
    assert(again.cacheEntriesInvalidated == 0);

    assert(f.detector.untrackFile(SOURCE_FILE));
    assert(!f.detector.untrackFile(SOURCE_FILE));
    assert(f.detector.detectAndInvalidateChanges().filesScanned == 0);
    std::cout << "[OK] missing tracked file\n";
}

void testInvalidationFailureIsReported() {
    std::cout << "Testing invalidation failure reporting...\n";
    Fixture f;
    const auto stuck = f.put("stuck");
    const auto removable = f.put("removable");
    assert(f.detector.registerFile(SOURCE_FILE, {stuck, removable}));
    f.files->failRemovesUnder(f.store->filePath(stuck));

    f.files->writeFile(SOURCE_FILE, "version 2");
    auto result = f.detector.detectAndInvalidateChanges();
    assert(!result.success);
    assert(result.errors.size() == 1);
    assert(result.filesChanged == 1);
    assert(result.cacheEntriesInvalidated == 1);
    assert(!f.store->exists(removable));
    // Частичный прогресс сохранён
    assert(f.detector.getTrackedFiles()[0].hash == util::sha256Hex(std::string("version 2")));
    std::cout << "[OK] invalidation failure reporting\n";
}

void testScheduledDetection() {
    std::cout << "Testing scheduled change detection...\n";
    Fixture f;
    const auto first = f.put("first");
    assert(f.detector.registerFile(SOURCE_FILE, {first}));
    f.files->writeFile(SOURCE_FILE, "version 2");

    auto scheduler = std::make_shared<thread::ManualScheduler>();
    auto handle = f.detector.scheduleChangeDetection(scheduler, milliseconds(1000));
    // Первый проход: сразу
    assert(!f.store->exists(first));
    assert(handle.isActive());
    assert(scheduler->tickCount() == 0);

    const auto second = f.put("second");
    assert(f.detector.registerFile(SOURCE_FILE, {second}));
    f.files->writeFile(SOURCE_FILE, "version 3");
    scheduler->advance(milliseconds(999));
    assert(f.store->exists(second));
    scheduler->advance(milliseconds(1));
    assert(scheduler->tickCount() == 1);
    assert(!f.store->exists(second));

    handle.cancel();
    assert(!handle.isActive());
    scheduler->advance(milliseconds(5000));
    assert(scheduler->tickCount() == 1);
    std::cout << "[OK] scheduled change detection\n";
}

void testOverlappingTickIsSkipped() {
    std::cout << "Testing overlapping tick is skipped...\n";
    Fixture f;
    assert(f.detector.registerFile(SOURCE_FILE, {}));
    auto scheduler = std::make_shared<CapturingScheduler>();
    auto handle = f.detector.scheduleChangeDetection(scheduler, milliseconds(1000));
    assert(handle.isActive());
    assert(f.detector.skippedTicks() == 0);

    // Tick во время чтения файла: проход ещё идёт
    f.files->onRead = [&] { scheduler->tick(); };
    scheduler->tick();
    assert(f.detector.skippedTicks() == 1);

    // Следующий tick снова выполняется
    scheduler->tick();
    assert(f.detector.skippedTicks() == 1);
    handle.cancel();
    assert(!scheduler->running);
    std::cout << "[OK] overlapping tick is skipped\n";
}

void testFailedTickDoesNotBlockLaterTicks() {
    std::cout << "Testing failed tick releases in-flight flag...\n";
    Fixture f;
    assert(f.detector.registerFile(SOURCE_FILE, {}));
    auto scheduler = std::make_shared<CapturingScheduler>();
    auto handle = f.detector.scheduleChangeDetection(scheduler, milliseconds(1000));

    f.files->onRead = [] { throw 42; };
    bool thrown = false;
    try {
        scheduler->tick();
    } catch (int) {
        thrown = true;
    }
    assert(thrown);

    scheduler->tick();
    assert(f.detector.skippedTicks() == 0);
    handle.cancel();
    std::cout << "[OK] failed tick releases in-flight flag\n";
}

void testReplaceRelatedHash() {
    std::cout << "Testing ChangeDetector::replaceRelatedHash...\n";
    Fixture f;
    const auto oldHash = f.put("old");
    const auto other = f.put("other");
    assert(f.detector.registerFile(SOURCE_FILE, {oldHash, other}));

    assert(f.detector.replaceRelatedHash(oldHash, "h-new"));
    auto tracked = f.detector.getTrackedFiles();
    assert(tracked[0].relatedCacheHashes == (std::vector<std::string>{other, "h-new"}));

    assert(f.detector.replaceRelatedHash(other, "h-next", true));
    tracked = f.detector.getTrackedFiles();
    assert(tracked[0].relatedCacheHashes == (std::vector<std::string>{other, "h-new", "h-next"}));

    // Неизвестный хэш: реестр не меняется
    assert(f.detector.replaceRelatedHash("unknown", "h-x"));
    assert(f.detector.getTrackedFiles()[0].relatedCacheHashes.size() == 3);
    std::cout << "[OK] ChangeDetector::replaceRelatedHash\n";
}

int main() {
    try {
        testComputeFileHash();
        testRegisterFile();
        testCorruptRegistry();
        testChangeTriggeredInvalidation();
        testMissingTrackedFile();
        testInvalidationFailureIsReported();
        testScheduledDetection();
        testOverlappingTickIsSkipped();
        testFailedTickDoesNotBlockLaterTicks();
        testReplaceRelatedHash();
        std::cout << "All ChangeDetector tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "ChangeDetector test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
