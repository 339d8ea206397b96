#pragma once

#include <optional>
#include <string>
#include "core/cache/index/CacheIndexManager.hpp"
#include "core/cache/storage/PayloadStore.hpp"

namespace offcache {
namespace core {
namespace cache {

// EvictionOutcome — итог удаления одной записи (payload + индекс)
struct EvictionOutcome {
    bool ok = false;             // Без ошибок ввода-вывода
    bool payloadRemoved = false; // Файл был и удалён
    bool indexRemoved = false;   // Запись была и удалена
    std::optional<std::string> error;

    bool removedAnything() const { return payloadRemoved || indexRemoved; }
};

// Удалить файл payload, затем запись индекса. Отсутствующий файл не ошибка:
// запись индекса всё равно удаляется. Сбой удаления файла оставляет запись.
EvictionOutcome evictEntry(PayloadStore& store, CacheIndexManager& index, const std::string& hash);

} // namespace cache
} // namespace core
} // namespace offcache
