#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/CacheContext.hpp"
#include "core/cache/CacheTypes.hpp"

namespace offcache {
namespace core {
namespace cache {

// SaveResult — итог сохранения payload
struct SaveResult {
    bool success = false;
    std::string hash;
    std::string filePath;
    bool deduplicated = false; // Файл уже был, запись пропущена
    std::optional<std::string> error;
};

enum class LoadStatus {
    Ok,
    NotFound,
    ParseError,
    IoError
};

// LoadResult — итог чтения payload
struct LoadResult {
    bool success = false;
    LoadStatus status = LoadStatus::NotFound;
    std::optional<CachedPayload> payload;
    std::optional<std::string> error;
};

enum class DeleteStatus {
    Deleted,
    NotFound,
    Failed
};

// PayloadStore — content-addressed хранилище {hash}.json в offline-cache.
// Про индекс ничего не знает.
class PayloadStore {
public:
    explicit PayloadStore(std::shared_ptr<CacheContext> context); // Конструктор

    static std::string hash(const nlohmann::json& content); // SHA-256 канонической сериализации

    SaveResult save(const nlohmann::json& data,
                    const std::string& source,
                    const std::string& type,
                    const std::optional<nlohmann::json>& metadata = std::nullopt); // Сохранить (с дедупликацией)
    LoadResult load(const std::string& hash) const; // Загрузить
    bool remove(const std::string& hash); // Удалить; false если нет файла
    DeleteStatus removeWithStatus(const std::string& hash); // Удалить с различением "нет" и "сбой"
    bool exists(const std::string& hash) const; // Есть ли файл
    int64_t size(const std::string& hash) const; // Размер файла или -1
    std::vector<std::string> listAll() const; // Все хэши (без файла индекса)
    std::string filePath(const std::string& hash) const; // Путь к файлу payload

private:
    std::shared_ptr<CacheContext> context_;
};

} // namespace cache
} // namespace core
} // namespace offcache
