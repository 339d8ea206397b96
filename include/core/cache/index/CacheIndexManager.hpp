#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/cache/CacheContext.hpp"
#include "core/cache/CacheTypes.hpp"
#include "core/cache/metrics/CacheStats.hpp"

namespace offcache {
namespace core {
namespace cache {

class PayloadStore;

// SearchFilter — точное совпадение по заданным полям; пустое поле = любое значение
struct SearchFilter {
    std::optional<std::string> source;
    std::optional<std::string> type;
    std::optional<util::TimePoint> cachedAfter;  // cachedAt >= cachedAfter
    std::optional<util::TimePoint> cachedBefore; // cachedAt <= cachedBefore
    std::optional<uint64_t> minSize;
    std::optional<uint64_t> maxSize;
};

// ReconcileResult — итог сверки индекса с файлами
struct ReconcileResult {
    bool success = true;
    size_t removedOrphans = 0; // Записи без файла
    size_t addedMissing = 0;   // Файлы без записи
    size_t sizesCorrected = 0; // Исправленные размеры
    std::vector<std::string> errors;
};

// CacheIndexManager — единственный владелец cache-index.json.
// Каждый цикл чтение-изменение-запись выполняется под мьютексом,
// запись идёт через атомарный writeFile файловой системы.
class CacheIndexManager {
public:
    explicit CacheIndexManager(std::shared_ptr<CacheContext> context); // Конструктор

    CacheIndex load() const; // Прочитать; при отсутствии/повреждении: пустой индекс
    bool save(CacheIndex& index); // Записать целиком, обновить updatedAt и итоги
    bool add(const CachedPayload& payload, uint64_t sizeBytes); // Добавить или обновить
    bool remove(const std::string& hash); // Удалить запись
    std::vector<IndexItem> search(const SearchFilter& filter) const; // Поиск
    std::optional<IndexItem> getItem(const std::string& hash) const; // Запись по хэшу
    bool touch(const std::string& hash); // lastAccessedAt = now, accessCount + 1
    CacheStats stats() const; // Сводка из индекса
    ReconcileResult reconcile(const PayloadStore& store); // Сверка с диском

private:
    CacheIndex loadUnlocked() const;
    bool saveUnlocked(CacheIndex& index);
    // Атомарно: загрузить, изменить (mutator вернул false = не сохранять), сохранить
    bool update(const std::function<bool(CacheIndex&)>& mutator);

    std::shared_ptr<CacheContext> context_;
    mutable std::mutex mutex_;
};

} // namespace cache
} // namespace core
} // namespace offcache
