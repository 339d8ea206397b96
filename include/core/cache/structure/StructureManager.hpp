#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "core/cache/CacheConfig.hpp"
#include "core/cache/CacheContext.hpp"

namespace offcache {
namespace core {
namespace cache {

// StructureResult — итог инициализации каталогов
struct StructureResult {
    bool success = false;
    CachePaths paths;
    std::vector<std::string> errors; // Ошибки по каждому каталогу
};

// StructureManager — создание и проверка раскладки каталогов кэша
class StructureManager {
public:
    explicit StructureManager(std::shared_ptr<CacheContext> context); // Конструктор
    StructureResult initializeStructure(); // Создать каталоги и пустой индекс
    bool isStructureValid() const; // Каталоги есть и доступны на запись
    size_t cleanupTempFiles(std::chrono::milliseconds maxAge = DEFAULT_TEMP_MAX_AGE_MS); // Удалить старые temp-файлы
private:
    std::shared_ptr<CacheContext> context_;
};

} // namespace cache
} // namespace core
} // namespace offcache
