#pragma once
#include <string>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "core/util/Logging.hpp"

namespace offcache {
namespace core {
namespace cache {

// Значения по умолчанию для политик обслуживания
constexpr std::chrono::milliseconds DEFAULT_RETENTION_MS{7LL * 24 * 60 * 60 * 1000};   // 7 дней
constexpr std::chrono::milliseconds DEFAULT_STALENESS_MS{24LL * 60 * 60 * 1000};       // 24 часа
constexpr std::chrono::milliseconds DEFAULT_TEMP_MAX_AGE_MS{24LL * 60 * 60 * 1000};    // 24 часа
constexpr std::chrono::milliseconds DEFAULT_CHANGE_DETECTION_MS{5LL * 60 * 1000};      // 5 минут
constexpr uint64_t DEFAULT_SIZE_THRESHOLD = 100ULL * 1024 * 1024;                      // 100 MB
constexpr size_t MIN_ITEMS_TO_KEEP = 10;

// CacheConfig — параметры кэша (корень, политики, логирование)
struct CacheConfig {
    std::string rootPath = "./.offcache"; // Корневой каталог
    std::chrono::milliseconds retentionPeriod = DEFAULT_RETENTION_MS; // Срок хранения
    std::chrono::milliseconds stalenessThreshold = DEFAULT_STALENESS_MS; // Порог устаревания
    uint64_t sizeThresholdBytes = DEFAULT_SIZE_THRESHOLD; // Порог размера для LRU
    size_t minItemsToKeep = MIN_ITEMS_TO_KEEP; // Не вытеснять последние N
    std::chrono::milliseconds changeDetectionInterval = DEFAULT_CHANGE_DETECTION_MS; // Интервал проверки файлов
    std::chrono::milliseconds tempMaxAge = DEFAULT_TEMP_MAX_AGE_MS; // Возраст временных файлов
    util::LoggingConfig logging; // Логирование
    bool validate() const {
        return !rootPath.empty() &&
               retentionPeriod.count() > 0 &&
               stalenessThreshold.count() > 0 &&
               changeDetectionInterval.count() > 0 &&
               tempMaxAge.count() >= 0 &&
               logging.validate();
    }
};

// Разбор JSON (camelCase, длительности в мс); отсутствующие ключи = значения по умолчанию
CacheConfig configFromJson(const nlohmann::json& j);
nlohmann::json configToJson(const CacheConfig& config);

// Загрузка из файла + переменная окружения OFFCACHE_ROOT. Бросает ConfigError.
CacheConfig loadConfig(const std::string& path);
void applyEnvironment(CacheConfig& config);

} // namespace cache
} // namespace core
} // namespace offcache
