#include "core/cache/CacheContext.hpp"
#include "core/fs/LocalFileSystem.hpp"
#include "core/util/Logging.hpp"
#include <filesystem>

namespace offcache {
namespace core {
namespace cache {

namespace {

std::string join(const std::string& base, const std::string& name) {
    return (std::filesystem::path(base) / name).string();
}

} // namespace

CachePaths CachePaths::fromRoot(const std::string& rootPath) {
    CachePaths paths;
    paths.root = rootPath;
    paths.offlineCache = join(rootPath, OFFLINE_CACHE_DIR);
    paths.processed = join(rootPath, PROCESSED_DIR);
    paths.temp = join(rootPath, TEMP_DIR);
    paths.indexFile = join(paths.offlineCache, INDEX_FILE);
    paths.registryFile = join(rootPath, REGISTRY_FILE);
    return paths;
}

std::string CachePaths::payloadFile(const std::string& hash) const {
    return join(offlineCache, hash + ".json");
}

std::shared_ptr<CacheContext> CacheContext::create(const std::string& rootPath,
                                                   std::shared_ptr<fs::IFileSystem> fileSystem,
                                                   std::shared_ptr<util::IClock> clock,
                                                   std::shared_ptr<spdlog::logger> logger) {
    auto context = std::make_shared<CacheContext>();
    context->paths = CachePaths::fromRoot(rootPath);
    context->fileSystem = fileSystem ? std::move(fileSystem) : std::make_shared<fs::LocalFileSystem>();
    context->clock = clock ? std::move(clock) : std::make_shared<util::RealClock>();
    context->logger = logger ? std::move(logger) : util::makeNullLogger();
    return context;
}

std::string CacheContext::pathFor(CacheSubDir subDir, const std::string& filename) const {
    switch (subDir) {
        case CacheSubDir::OfflineCache: return join(paths.offlineCache, filename);
        case CacheSubDir::Processed: return join(paths.processed, filename);
        case CacheSubDir::Temp: return join(paths.temp, filename);
        case CacheSubDir::Root: break;
    }
    return join(paths.root, filename);
}

} // namespace cache
} // namespace core
} // namespace offcache
