#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace offcache {
namespace core {
namespace cache {

// CacheStats — сводка по индексу (без сканирования диска)
struct CacheStats {
    uint64_t totalItems = 0;     // Кол-во записей
    uint64_t totalSizeBytes = 0; // Суммарный размер (байт)
    double totalSizeMB = 0.0;    // То же в MB, 2 знака
    std::optional<std::string> oldestItem; // cachedAt самой старой записи
    std::optional<std::string> newestItem; // cachedAt самой новой записи
    std::map<std::string, uint64_t> bySource; // Записей по источнику
    std::map<std::string, uint64_t> byType;   // Записей по типу
    nlohmann::json toJson() const {
        return {
            {"totalItems", totalItems},
            {"totalSizeBytes", totalSizeBytes},
            {"totalSizeMB", totalSizeMB},
            {"oldestItem", oldestItem ? nlohmann::json(*oldestItem) : nlohmann::json()},
            {"newestItem", newestItem ? nlohmann::json(*newestItem) : nlohmann::json()},
            {"bySource", bySource},
            {"byType", byType}
        };
    }
};

} // namespace cache
} // namespace core
} // namespace offcache
