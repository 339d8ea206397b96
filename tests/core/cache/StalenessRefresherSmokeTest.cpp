#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include "core/cache/change/ChangeDetector.hpp"
#include "core/cache/index/CacheIndexManager.hpp"
#include "core/cache/policy/StalenessRefresher.hpp"
#include "core/cache/storage/PayloadStore.hpp"
#include "core/cache/structure/StructureManager.hpp"
#include "core/fs/MemoryFileSystem.hpp"

using namespace offcache::core;
using std::chrono::hours;

namespace {

struct Fixture {
    std::shared_ptr<util::ManualClock> clock =
        std::make_shared<util::ManualClock>(*util::parseIsoString("2026-01-01T00:00:00.000Z"));
    std::shared_ptr<fs::MemoryFileSystem> files = std::make_shared<fs::MemoryFileSystem>(clock);
    std::shared_ptr<cache::CacheContext> context = cache::CacheContext::create("/cache", files, clock);
    std::shared_ptr<cache::PayloadStore> store = std::make_shared<cache::PayloadStore>(context);
    std::shared_ptr<cache::CacheIndexManager> index = std::make_shared<cache::CacheIndexManager>(context);
    cache::StalenessRefresher refresher{context, store, index};

    Fixture() {
        cache::StructureManager(context).initializeStructure();
    }

    std::string put(const nlohmann::json& data) {
        auto saved = store->save(data, "github", "repo");
        auto loaded = store->load(saved.hash);
        index->add(*loaded.payload, static_cast<uint64_t>(store->size(saved.hash)));
        return saved.hash;
    }
};

cache::IndexItem makeItem(uint64_t accessCount, uint64_t sizeBytes, util::TimePoint cachedAt) {
    cache::IndexItem item;
    item.hash = "h" + std::to_string(accessCount);
    item.cachedAt = cachedAt;
    item.accessCount = accessCount;
    item.sizeBytes = sizeBytes;
    return item;
}

} // namespace

void testIsStale() {
    std::cout << "Testing StalenessRefresher::isStale...\n";
    auto t0 = *util::parseIsoString("2026-01-01T00:00:00.000Z");
    auto item = makeItem(1, 10, t0);
    assert(!cache::StalenessRefresher::isStale(item, cache::DEFAULT_STALENESS_MS, t0 + hours(23)));
    assert(cache::StalenessRefresher::isStale(item, cache::DEFAULT_STALENESS_MS, t0 + hours(25)));
    std::cout << "[OK] StalenessRefresher::isStale\n";
}

void testPriorityMonotonicity() {
    std::cout << "Testing refresh priority monotonicity...\n";
    auto t0 = *util::parseIsoString("2026-01-01T00:00:00.000Z");
    auto now = t0 + hours(48);
    auto hot = makeItem(100, 2048, t0);
    auto cold = makeItem(1, 2048, t0);
    assert(cache::StalenessRefresher::calculateRefreshPriority(hot, now) >
           cache::StalenessRefresher::calculateRefreshPriority(cold, now));

    // Большие и давно не используемые: ниже
    auto large = makeItem(5, 50ULL * 1024 * 1024, t0);
    auto small = makeItem(5, 1024, t0);
    assert(cache::StalenessRefresher::calculateRefreshPriority(small, now) >
           cache::StalenessRefresher::calculateRefreshPriority(large, now));
    auto ancient = makeItem(5, 1024, t0 - hours(24 * 30));
    assert(cache::StalenessRefresher::calculateRefreshPriority(small, now) >
           cache::StalenessRefresher::calculateRefreshPriority(ancient, now));

    auto sorted = cache::StalenessRefresher::sortByRefreshPriority({cold, large, hot}, now);
    assert(sorted[0].hash == hot.hash);
    assert(sorted[2].hash == large.hash);
    std::cout << "[OK] refresh priority monotonicity\n";
}

void testGetStaleItems() {
    std::cout << "Testing StalenessRefresher::getStaleItems...\n";
    Fixture f;
    const auto old = f.put("old");
    f.clock->advance(hours(20));
    f.put("recent");
    f.clock->advance(hours(10));
    auto stale = f.refresher.getStaleItems(hours(24));
    assert(stale.size() == 1);
    assert(stale[0].hash == old);
    std::cout << "[OK] StalenessRefresher::getStaleItems\n";
}

void testRefreshBatch() {
    std::cout << "Testing StalenessRefresher::refreshStaleItems...\n";
    Fixture f;
    const auto good = f.put({{"v", 1}});
    const auto empty = f.put({{"v", 2}});
    const auto broken = f.put({{"v", 3}});
    for (int i = 0; i < 5; ++i) {
        f.index->touch(good); // самый востребованный
    }
    f.clock->advance(hours(48));

    std::vector<std::string> visited;
    auto result = f.refresher.refreshStaleItems(hours(24), [&](const cache::IndexItem& item)
                                                -> std::optional<nlohmann::json> {
        visited.push_back(item.hash);
        if (item.hash == good) return nlohmann::json{{"v", 1}, {"fresh", true}};
        if (item.hash == broken) throw std::runtime_error("remote unavailable");
        return std::nullopt;
    });

    assert(visited.size() == 3);
    assert(visited[0] == good);
    assert(result.itemsRefreshed == 1);
    assert(result.itemsFailed == 2);
    assert(result.itemsSkipped == 0);
    assert(!result.success);

    const auto& goodResult = result.results[0];
    assert(goodResult.success);
    assert(goodResult.newHash.has_value());
    const std::string newHash = *goodResult.newHash;
    assert(newHash != good);

    // Старая запись заменена новой
    assert(!f.store->exists(good));
    assert(!f.index->getItem(good).has_value());
    auto refreshed = f.store->load(newHash);
    assert(refreshed.success);
    assert(refreshed.payload->source == "github");
    assert((*refreshed.payload->metadata)["refreshedFrom"] == good);
    assert(f.index->getItem(newHash).has_value());

    // Неудачные остаются на месте
    assert(f.store->exists(empty) && f.store->exists(broken));
    std::cout << "[OK] StalenessRefresher::refreshStaleItems\n";
}

void testRefreshSameContentAndLimit() {
    std::cout << "Testing StalenessRefresher same content and maxItems...\n";
    Fixture f;
    const auto a = f.put("alpha");
    f.put("bravo");
    f.put("delta");
    f.clock->advance(hours(48));

    // Равный приоритет: порядок индекса. Тот же контент: запись остаётся
    auto result = f.refresher.refreshStaleItems(hours(24), [&](const cache::IndexItem& item)
                                                -> std::optional<nlohmann::json> {
        assert(item.hash == a);
        return nlohmann::json("alpha");
    }, 1);
    assert(result.itemsRefreshed == 1);
    assert(result.itemsSkipped == 2);
    assert(result.success);
    assert(*result.results[0].newHash == a);
    auto item = f.index->getItem(a);
    assert(item.has_value());
    assert(item->accessCount == 2);
    assert(f.store->exists(a));
    std::cout << "[OK] StalenessRefresher same content and maxItems\n";
}

void testNonStandardExceptionIsRecorded() {
    std::cout << "Testing StalenessRefresher non-standard exception...\n";
    Fixture f;
    const auto a = f.put("alpha");
    const auto b = f.put("bravo");
    f.clock->advance(hours(48));

    auto result = f.refresher.refreshStaleItems(hours(24), [&](const cache::IndexItem& item)
                                                -> std::optional<nlohmann::json> {
        if (item.hash == a) throw 7;
        return nlohmann::json("bravo v2");
    });
    assert(result.itemsFailed == 1);
    assert(result.itemsRefreshed == 1);
    assert(!result.success);
    assert(f.store->exists(a));
    assert(!f.store->exists(b));
    std::cout << "[OK] StalenessRefresher non-standard exception\n";
}

void testRefreshedEntryStaysLinkedToSource() {
    std::cout << "Testing refreshed entry follows source changes...\n";
    Fixture f;
    auto detector = std::make_shared<cache::ChangeDetector>(f.context, f.store, f.index);
    cache::StalenessRefresher linked{f.context, f.store, f.index, detector};
    f.files->createDirectories("/src");
    f.files->writeFile("/src/a.txt", "v1");

    const auto original = f.put("report v1");
    assert(detector->registerFile("/src/a.txt", {original}));
    f.clock->advance(hours(48));

    auto result = linked.refreshStaleItems(hours(24), [](const cache::IndexItem&)
                                           -> std::optional<nlohmann::json> {
        return nlohmann::json("report v2");
    });
    assert(result.success && result.itemsRefreshed == 1);
    const std::string refreshed = *result.results[0].newHash;
    assert(refreshed != original);
    auto tracked = detector->getTrackedFiles();
    assert(tracked[0].relatedCacheHashes == (std::vector<std::string>{refreshed}));

    f.files->writeFile("/src/a.txt", "v2");
    auto detection = detector->detectAndInvalidateChanges();
    assert(detection.filesChanged == 1);
    assert(detection.cacheEntriesInvalidated == 1);
    assert(!f.store->exists(refreshed));
    assert(!f.index->getItem(refreshed).has_value());
    std::cout << "[OK] refreshed entry follows source changes\n";
}

int main() {
    try {
        testIsStale();
        testPriorityMonotonicity();
        testGetStaleItems();
        testRefreshBatch();
        testRefreshSameContentAndLimit();
        testNonStandardExceptionIsRecorded();
        testRefreshedEntryStaysLinkedToSource();
        std::cout << "All StalenessRefresher tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "StalenessRefresher test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
