#include "core/cache/structure/StructureManager.hpp"
#include "core/cache/CacheTypes.hpp"
#include <utility>

namespace offcache {
namespace core {
namespace cache {

StructureManager::StructureManager(std::shared_ptr<CacheContext> context)
    : context_(std::move(context)) {}

StructureResult StructureManager::initializeStructure() {
    StructureResult result;
    result.paths = context_->paths;
    auto& files = context_->files();

    const std::pair<const char*, std::string> dirs[] = {
        {"root", context_->paths.root},
        {"offlineCache", context_->paths.offlineCache},
        {"processed", context_->paths.processed},
        {"temp", context_->paths.temp}
    };

    // Каждый каталог независимо: сбой одного не мешает остальным
    for (const auto& [name, dirPath] : dirs) {
        try {
            if (!files.isDirectory(dirPath)) {
                files.createDirectories(dirPath);
                context_->log().info("StructureManager: создан каталог {} ({})", name, dirPath);
            }
        } catch (const std::exception& e) {
            result.errors.push_back(std::string("Failed to create ") + name + ": " + e.what());
            context_->log().error("StructureManager: не удалось создать каталог {}: {}", name, e.what());
        }
    }

    const std::string& indexPath = context_->paths.indexFile;
    try {
        if (!files.exists(indexPath)) {
            CacheIndex index = CacheIndex::fresh(context_->now());
            files.writeFile(indexPath, index.toJson().dump(2));
            context_->log().info("StructureManager: создан файл индекса {}", indexPath);
        }
    } catch (const std::exception& e) {
        result.errors.push_back(std::string("Failed to create cache index: ") + e.what());
        context_->log().warn("StructureManager: не удалось создать индекс: {}", e.what());
    }

    result.success = result.errors.empty();
    if (result.success) {
        context_->log().info("StructureManager: структура кэша инициализирована ({})", context_->paths.root);
    } else {
        context_->log().warn("StructureManager: структура инициализирована с ошибками: {}", result.errors.size());
    }
    return result;
}

bool StructureManager::isStructureValid() const {
    auto& files = context_->files();
    for (const auto* dirPath : {&context_->paths.root, &context_->paths.offlineCache,
                                &context_->paths.processed, &context_->paths.temp}) {
        try {
            if (!files.isDirectory(*dirPath) || !files.isWritable(*dirPath)) {
                return false;
            }
        } catch (const std::exception& e) {
            context_->log().warn("StructureManager: проверка {} не удалась: {}", *dirPath, e.what());
            return false;
        }
    }
    return true;
}

size_t StructureManager::cleanupTempFiles(std::chrono::milliseconds maxAge) {
    auto& files = context_->files();
    const std::string& tempPath = context_->paths.temp;
    size_t cleaned = 0;

    try {
        if (!files.isDirectory(tempPath)) {
            return 0;
        }
        const auto now = context_->now();
        for (const auto& name : files.listDirectory(tempPath)) {
            const std::string filePath = context_->pathFor(CacheSubDir::Temp, name);
            try {
                if (files.isDirectory(filePath)) {
                    continue;
                }
                auto age = now - files.lastWriteTime(filePath);
                if (age > maxAge && files.removeFile(filePath)) {
                    ++cleaned;
                }
            } catch (const std::exception& e) {
                // Недоступный файл пропускаем
                context_->log().debug("StructureManager: пропуск {}: {}", filePath, e.what());
            }
        }
    } catch (const std::exception& e) {
        context_->log().warn("StructureManager: ошибка очистки temp: {}", e.what());
        return cleaned;
    }

    if (cleaned > 0) {
        context_->log().info("StructureManager: удалено временных файлов: {}", cleaned);
    }
    return cleaned;
}

} // namespace cache
} // namespace core
} // namespace offcache
