#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/util/Clock.hpp"

namespace offcache {
namespace core {
namespace fs {

// IFileSystem — доступ к файлам для всех компонентов кэша.
// Ошибки ввода-вывода выбрасываются как FileSystemError; компоненты
// перехватывают их и превращают в результат или sentinel.
class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual bool exists(const std::string& path) const = 0; // Существует?
    virtual bool isDirectory(const std::string& path) const = 0; // Каталог?
    virtual void createDirectories(const std::string& path) = 0; // Создать каталоги (рекурсивно)
    virtual std::string readFile(const std::string& path) const = 0; // Прочитать целиком
    virtual void writeFile(const std::string& path, const std::string& content) = 0; // Атомарная запись
    virtual bool removeFile(const std::string& path) = 0; // false, если файла нет
    virtual std::vector<std::string> listDirectory(const std::string& path) const = 0; // Имена записей
    virtual uint64_t fileSize(const std::string& path) const = 0; // Размер (байт)
    virtual util::TimePoint lastWriteTime(const std::string& path) const = 0; // mtime
    virtual bool isWritable(const std::string& path) const = 0; // Проба записи в каталог
};

} // namespace fs
} // namespace core
} // namespace offcache
