#pragma once

#include "core/fs/FileSystem.hpp"

namespace offcache {
namespace core {
namespace fs {

// LocalFileSystem — реализация поверх std::filesystem и POSIX
class LocalFileSystem : public IFileSystem {
public:
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
};

} // namespace fs
} // namespace core
} // namespace offcache
