#include "core/fs/LocalFileSystem.hpp"
#include "core/util/Errors.hpp"
#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace offcache {
namespace core {
namespace fs {

namespace stdfs = std::filesystem;

namespace {

std::atomic<uint64_t> g_tempCounter{0};

std::string uniqueSuffix() {
    std::stringstream ss;
    ss << ".tmp-" << ::getpid() << "-" << g_tempCounter.fetch_add(1);
    return ss.str();
}

} // namespace

bool LocalFileSystem::exists(const std::string& path) const {
    std::error_code ec;
    return stdfs::exists(path, ec);
}

bool LocalFileSystem::isDirectory(const std::string& path) const {
    std::error_code ec;
    return stdfs::is_directory(path, ec);
}

void LocalFileSystem::createDirectories(const std::string& path) {
    std::error_code ec;
    stdfs::create_directories(path, ec);
    if (ec) {
        throw FileSystemError(path, "create_directories failed (" + ec.message() + ")");
    }
    if (!stdfs::is_directory(path, ec)) {
        throw FileSystemError(path, "not a directory");
    }
}

std::string LocalFileSystem::readFile(const std::string& path) const {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw FileSystemError(path, "cannot open for reading");
    }
    std::string contents((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        throw FileSystemError(path, "read failed");
    }
    return contents;
}

void LocalFileSystem::writeFile(const std::string& path, const std::string& content) {
    // Пишем во временный файл рядом и переименовываем: читатели видят либо старую, либо новую версию
    const std::string tmpPath = path + uniqueSuffix();
    {
        std::ofstream ofs(tmpPath, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw FileSystemError(tmpPath, "cannot open for writing");
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        ofs.flush();
        if (!ofs) {
            ofs.close();
            std::error_code ignored;
            stdfs::remove(tmpPath, ignored);
            throw FileSystemError(tmpPath, "write failed");
        }
    }
    std::error_code ec;
    stdfs::rename(tmpPath, path, ec);
    if (ec) {
        std::error_code ignored;
        stdfs::remove(tmpPath, ignored);
        throw FileSystemError(path, "rename failed (" + ec.message() + ")");
    }
}

bool LocalFileSystem::removeFile(const std::string& path) {
    std::error_code ec;
    if (!stdfs::exists(path, ec)) {
        return false;
    }
    bool removed = stdfs::remove(path, ec);
    if (ec) {
        throw FileSystemError(path, "remove failed (" + ec.message() + ")");
    }
    return removed;
}

std::vector<std::string> LocalFileSystem::listDirectory(const std::string& path) const {
    std::vector<std::string> names;
    std::error_code ec;
    stdfs::directory_iterator it(path, ec);
    if (ec) {
        throw FileSystemError(path, "cannot list directory (" + ec.message() + ")");
    }
    for (const auto& entry : it) {
        names.push_back(entry.path().filename().string());
    }
    return names;
}

uint64_t LocalFileSystem::fileSize(const std::string& path) const {
    std::error_code ec;
    auto size = stdfs::file_size(path, ec);
    if (ec) {
        throw FileSystemError(path, "file_size failed (" + ec.message() + ")");
    }
    return static_cast<uint64_t>(size);
}

util::TimePoint LocalFileSystem::lastWriteTime(const std::string& path) const {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        throw FileSystemError(path, std::string("stat failed (") + std::strerror(errno) + ")");
    }
    return util::TimePoint(std::chrono::seconds(st.st_mtim.tv_sec)) +
           std::chrono::duration_cast<util::SystemClock::duration>(std::chrono::nanoseconds(st.st_mtim.tv_nsec));
}

bool LocalFileSystem::isWritable(const std::string& path) const {
    if (!isDirectory(path)) {
        return false;
    }
    // Реальная проба: создать и удалить файл
    const std::string checkFile = (stdfs::path(path) / (".write-check" + uniqueSuffix())).string();
    {
        std::ofstream ofs(checkFile, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            return false;
        }
    }
    std::error_code ec;
    stdfs::remove(checkFile, ec);
    return true;
}

} // namespace fs
} // namespace core
} // namespace offcache
