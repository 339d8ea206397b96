#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace offcache {
namespace core {
namespace util {

// LoggingConfig — уровень, файл и ротация логов
struct LoggingConfig {
    std::string level = "info";  // trace|debug|info|warn|err|critical|off
    std::string logPath;         // Пусто = только консоль
    size_t maxLogSize = 1024 * 1024 * 5; // 5MB
    size_t maxLogFiles = 2;
    bool validate() const {
        return maxLogSize > 0 && maxLogFiles > 0;
    }
};

constexpr const char* LOGGER_NAME = "offcache";

// Создать и зарегистрировать логгер "offcache" (консоль + ротация в файл)
std::shared_ptr<spdlog::logger> initializeLogging(const LoggingConfig& config);

// Логгер без вывода для библиотечного кода и тестов
std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name = "offcache-null");

void shutdownLogging();

} // namespace util
} // namespace core
} // namespace offcache
