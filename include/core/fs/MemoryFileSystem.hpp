#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include "core/fs/FileSystem.hpp"

namespace offcache {
namespace core {
namespace fs {

// MemoryFileSystem — файловая система в памяти для тестов.
// Поддерживает внедрение сбоев: запись/удаление под префиксом пути,
// каталоги только для чтения, ручная установка mtime.
class MemoryFileSystem : public IFileSystem {
public:
    explicit MemoryFileSystem(std::shared_ptr<util::IClock> clock = nullptr);

    bool exists(const std::string& path) const override;
    bool isDirectory(const std::string& path) const override;
    void createDirectories(const std::string& path) override;
    std::string readFile(const std::string& path) const override;
    void writeFile(const std::string& path, const std::string& content) override;
    bool removeFile(const std::string& path) override;
    std::vector<std::string> listDirectory(const std::string& path) const override;
    uint64_t fileSize(const std::string& path) const override;
    util::TimePoint lastWriteTime(const std::string& path) const override;
    bool isWritable(const std::string& path) const override;

    void failWritesUnder(const std::string& prefix); // Запись под префиксом падает
    void failRemovesUnder(const std::string& prefix); // Удаление под префиксом падает
    void failCreateDirectory(const std::string& path); // Создание каталога падает
    void setReadOnly(const std::string& dir, bool readOnly); // Каталог только для чтения
    void setLastWriteTime(const std::string& path, util::TimePoint tp); // Подменить mtime
    void clearFailures(); // Снять все сбои
    size_t fileCount() const; // Кол-во файлов
    size_t writeCount() const; // Кол-во успешных записей

private:
    struct FileNode {
        std::string content;
        util::TimePoint mtime;
    };
    static std::string normalize(const std::string& path);
    static std::string parentOf(const std::string& path);
    static bool isUnder(const std::string& path, const std::string& prefix);
    bool matchesAny(const std::set<std::string>& prefixes, const std::string& path) const;
    util::TimePoint now() const;

    std::shared_ptr<util::IClock> clock_;
    mutable std::mutex mutex_;
    std::map<std::string, FileNode> files_;
    std::set<std::string> dirs_;
    std::set<std::string> failWrites_;
    std::set<std::string> failRemoves_;
    std::set<std::string> failMkdirs_;
    std::set<std::string> readOnly_;
    size_t writes_ = 0;
};

} // namespace fs
} // namespace core
} // namespace offcache
