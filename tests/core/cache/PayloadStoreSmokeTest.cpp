#include <cassert>
#include <iostream>
#include <memory>
#include <algorithm>
#include "core/cache/storage/PayloadStore.hpp"
#include "core/cache/structure/StructureManager.hpp"
#include "core/fs/MemoryFileSystem.hpp"
#include "core/util/Hash.hpp"

using namespace offcache::core;

namespace {

struct Fixture {
    std::shared_ptr<util::ManualClock> clock =
        std::make_shared<util::ManualClock>(*util::parseIsoString("2026-01-01T00:00:00.000Z"));
    std::shared_ptr<fs::MemoryFileSystem> files = std::make_shared<fs::MemoryFileSystem>(clock);
    std::shared_ptr<cache::CacheContext> context = cache::CacheContext::create("/cache", files, clock);
    cache::PayloadStore store{context};

    Fixture() {
        cache::StructureManager(context).initializeStructure();
    }
};

} // namespace

void testHashCanonicalization() {
    std::cout << "Testing PayloadStore hash...\n";
    // Строки хэшируются как есть
    assert(cache::PayloadStore::hash("abc") == util::sha256Hex(std::string("abc")));
    // Объекты: компактный JSON с отсортированными ключами
    nlohmann::json a = {{"b", 1}, {"a", 2}};
    assert(cache::PayloadStore::hash(a) == util::sha256Hex(std::string(R"({"a":2,"b":1})")));
    nlohmann::json b = nlohmann::json::parse(R"({"a": 2, "b": 1})");
    assert(cache::PayloadStore::hash(a) == cache::PayloadStore::hash(b));
    assert(cache::PayloadStore::hash(a) != cache::PayloadStore::hash(nlohmann::json{{"a", 3}}));
    std::cout << "[OK] PayloadStore hash\n";
}

void testDedupIdempotence() {
    std::cout << "Testing PayloadStore dedup...\n";
    Fixture f;
    nlohmann::json data = {{"answer", 42}, {"tags", {"x", "y"}}};
    auto first = f.store.save(data, "llm", "completion");
    assert(first.success);
    assert(!first.deduplicated);
    assert(first.filePath == "/cache/offline-cache/" + first.hash + ".json");

    const size_t writes = f.files->writeCount();
    f.clock->advance(std::chrono::minutes(10));
    auto second = f.store.save(data, "github", "other");
    assert(second.success);
    assert(second.deduplicated);
    assert(second.hash == first.hash);
    assert(f.files->writeCount() == writes);
    assert(f.store.listAll().size() == 1);

    // Первая запись не перезаписана
    auto loaded = f.store.load(first.hash);
    assert(loaded.payload->source == "llm");
    std::cout << "[OK] PayloadStore dedup\n";
}

void testRoundTrip() {
    std::cout << "Testing PayloadStore round-trip...\n";
    Fixture f;
    nlohmann::json data = {{"items", {1, 2, 3}}, {"nested", {{"k", "v"}}}, {"flag", true}};
    nlohmann::json metadata = {{"model", "m1"}};
    auto saved = f.store.save(data, "llm", "completion", metadata);
    assert(saved.success);

    auto loaded = f.store.load(saved.hash);
    assert(loaded.success);
    assert(loaded.status == cache::LoadStatus::Ok);
    assert(loaded.payload->data == data);
    assert(loaded.payload->hash == saved.hash);
    assert(loaded.payload->source == "llm");
    assert(loaded.payload->type == "completion");
    assert(loaded.payload->cachedAt == f.clock->now());
    assert(loaded.payload->metadata.has_value());
    assert((*loaded.payload->metadata)["model"] == "m1");

    // Файл: отформатированный JSON
    auto text = f.files->readFile(saved.filePath);
    assert(text.find('\n') != std::string::npos);
    std::cout << "[OK] PayloadStore round-trip\n";
}

void testLoadFailures() {
    std::cout << "Testing PayloadStore load failures...\n";
    Fixture f;
    auto missing = f.store.load("deadbeef");
    assert(!missing.success);
    assert(missing.status == cache::LoadStatus::NotFound);
    assert(!missing.payload.has_value());
    assert(*missing.error == "Payload deadbeef not found in cache");

    f.files->writeFile(f.store.filePath("broken"), "{not json");
    auto broken = f.store.load("broken");
    assert(!broken.success);
    assert(broken.status == cache::LoadStatus::ParseError);

    // Корректный JSON без обязательных полей
    f.files->writeFile(f.store.filePath("partial"), R"({"data": 1})");
    assert(f.store.load("partial").status == cache::LoadStatus::ParseError);
    std::cout << "[OK] PayloadStore load failures\n";
}

void testDeleteAndQueries() {
    std::cout << "Testing PayloadStore delete/exists/size/listAll...\n";
    Fixture f;
    auto a = f.store.save("first", "user", "note");
    auto b = f.store.save("second", "user", "note");
    assert(f.store.exists(a.hash));
    assert(f.store.size(a.hash) == static_cast<int64_t>(f.files->fileSize(a.filePath)));
    assert(f.store.size("missing") == -1);

    auto all = f.store.listAll();
    assert(all.size() == 2); // cache-index.json не входит
    assert(std::find(all.begin(), all.end(), a.hash) != all.end());
    assert(std::find(all.begin(), all.end(), b.hash) != all.end());

    assert(f.store.remove(a.hash));
    assert(!f.store.exists(a.hash));
    assert(!f.store.remove(a.hash));
    assert(f.store.removeWithStatus(a.hash) == cache::DeleteStatus::NotFound);

    f.files->failRemovesUnder(b.filePath);
    assert(f.store.removeWithStatus(b.hash) == cache::DeleteStatus::Failed);
    assert(f.store.exists(b.hash));
    std::cout << "[OK] PayloadStore delete/exists/size/listAll\n";
}

void testSaveFailure() {
    std::cout << "Testing PayloadStore save failure...\n";
    Fixture f;
    f.files->failWritesUnder("/cache/offline-cache");
    auto result = f.store.save({{"k", 1}}, "llm", "x");
    assert(!result.success);
    assert(result.error.has_value());
    assert(f.store.listAll().empty());
    std::cout << "[OK] PayloadStore save failure\n";
}

int main() {
    try {
        testHashCanonicalization();
        testDedupIdempotence();
        testRoundTrip();
        testLoadFailures();
        testDeleteAndQueries();
        testSaveFailure();
        std::cout << "All PayloadStore tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "PayloadStore test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
