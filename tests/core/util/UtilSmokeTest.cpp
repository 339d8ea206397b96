#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include "core/fs/MemoryFileSystem.hpp"
#include "core/util/Clock.hpp"
#include "core/util/Errors.hpp"
#include "core/util/Hash.hpp"

using namespace offcache::core;

void testIsoTimestamps() {
    std::cout << "Testing ISO-8601 timestamps...\n";
    auto tp = util::parseIsoString("2026-03-15T10:20:30.456Z");
    assert(tp.has_value());
    assert(util::toIsoString(*tp) == "2026-03-15T10:20:30.456Z");

    // Без дробной части
    auto whole = util::parseIsoString("2026-03-15T10:20:30Z");
    assert(whole.has_value());
    assert(util::toIsoString(*whole) == "2026-03-15T10:20:30.000Z");
    assert(*tp - *whole == std::chrono::milliseconds(456));

    assert(!util::parseIsoString("yesterday").has_value());
    assert(!util::parseIsoString("").has_value());
    std::cout << "[OK] ISO-8601 timestamps\n";
}

void testManualClock() {
    std::cout << "Testing ManualClock...\n";
    auto start = *util::parseIsoString("2026-01-01T00:00:00.000Z");
    util::ManualClock clock(start);
    assert(clock.now() == start);
    clock.advance(std::chrono::hours(25));
    assert(util::toIsoString(clock.now()) == "2026-01-02T01:00:00.000Z");
    clock.set(start);
    assert(clock.now() == start);
    assert(util::toUnixMillis(start) == 1767225600000LL);
    std::cout << "[OK] ManualClock\n";
}

void testSha256() {
    std::cout << "Testing SHA-256...\n";
    assert(util::sha256Hex(std::string("abc")) ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(util::sha256Hex(std::string()) ==
           "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    std::vector<uint8_t> bytes = {'a', 'b', 'c'};
    assert(util::sha256Hex(bytes) == util::sha256Hex(std::string("abc")));
    std::cout << "[OK] SHA-256\n";
}

void testMemoryFileSystem() {
    std::cout << "Testing MemoryFileSystem...\n";
    auto clock = std::make_shared<util::ManualClock>();
    fs::MemoryFileSystem files(clock);

    // Без родительского каталога запись невозможна
    bool threw = false;
    try {
        files.writeFile("/data/a.txt", "x");
    } catch (const FileSystemError& e) {
        threw = true;
        assert(e.path().find("a.txt") != std::string::npos);
    }
    assert(threw);

    files.createDirectories("/data/sub");
    assert(files.isDirectory("/data"));
    files.writeFile("/data/a.txt", "hello");
    assert(files.readFile("/data/a.txt") == "hello");
    assert(files.fileSize("/data/a.txt") == 5);
    assert(files.listDirectory("/data").size() == 2);

    files.failRemovesUnder("/data");
    threw = false;
    try {
        files.removeFile("/data/a.txt");
    } catch (const FileSystemError&) {
        threw = true;
    }
    assert(threw);
    files.clearFailures();
    assert(files.removeFile("/data/a.txt"));
    assert(!files.removeFile("/data/a.txt"));

    files.setReadOnly("/data", true);
    assert(!files.isWritable("/data"));
    files.setReadOnly("/data", false);
    assert(files.isWritable("/data"));
    std::cout << "[OK] MemoryFileSystem\n";
}

int main() {
    try {
        testIsoTimestamps();
        testManualClock();
        testSha256();
        testMemoryFileSystem();
        std::cout << "All util tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Util test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
