#pragma once

#include <stdexcept>
#include <string>

namespace offcache {
namespace core {

// CacheError — неожиданные внутренние сбои (не путать с "не найдено")
class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& msg) : std::runtime_error(msg) {}
};

// ConfigError — некорректная конфигурация
class ConfigError : public CacheError {
public:
    explicit ConfigError(const std::string& msg) : CacheError(msg) {}
};

// FileSystemError — сбой ввода-вывода, перехватывается на границе компонентов
class FileSystemError : public CacheError {
public:
    FileSystemError(const std::string& path, const std::string& msg)
        : CacheError(msg + ": " + path), path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

} // namespace core
} // namespace offcache
