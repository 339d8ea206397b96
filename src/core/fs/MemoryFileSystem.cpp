#include "core/fs/MemoryFileSystem.hpp"
#include "core/util/Errors.hpp"
#include <filesystem>

namespace offcache {
namespace core {
namespace fs {

MemoryFileSystem::MemoryFileSystem(std::shared_ptr<util::IClock> clock)
    : clock_(clock ? std::move(clock) : std::make_shared<util::RealClock>()) {
    dirs_.insert("/");
    dirs_.insert(".");
}

std::string MemoryFileSystem::normalize(const std::string& path) {
    std::string norm = std::filesystem::path(path).lexically_normal().generic_string();
    while (norm.size() > 1 && norm.back() == '/') {
        norm.pop_back();
    }
    return norm.empty() ? "." : norm;
}

std::string MemoryFileSystem::parentOf(const std::string& path) {
    std::string parent = std::filesystem::path(path).parent_path().generic_string();
    if (parent.empty()) {
        return path.front() == '/' ? "/" : ".";
    }
    return parent;
}

bool MemoryFileSystem::isUnder(const std::string& path, const std::string& prefix) {
    if (path == prefix) return true;
    if (path.size() <= prefix.size()) return false;
    return path.compare(0, prefix.size(), prefix) == 0 &&
           (prefix.back() == '/' || path[prefix.size()] == '/');
}

bool MemoryFileSystem::matchesAny(const std::set<std::string>& prefixes, const std::string& path) const {
    for (const auto& prefix : prefixes) {
        if (isUnder(path, prefix)) return true;
    }
    return false;
}

util::TimePoint MemoryFileSystem::now() const {
    return clock_->now();
}

bool MemoryFileSystem::exists(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto p = normalize(path);
    return files_.count(p) > 0 || dirs_.count(p) > 0;
}

bool MemoryFileSystem::isDirectory(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dirs_.count(normalize(path)) > 0;
}

void MemoryFileSystem::createDirectories(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto p = normalize(path);
    if (matchesAny(failMkdirs_, p)) {
        throw FileSystemError(p, "create_directories failed (injected)");
    }
    if (files_.count(p)) {
        throw FileSystemError(p, "not a directory");
    }
    std::string current = p;
    while (!dirs_.count(current)) {
        if (files_.count(current)) {
            throw FileSystemError(current, "not a directory");
        }
        dirs_.insert(current);
        current = parentOf(current);
    }
}

std::string MemoryFileSystem::readFile(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(normalize(path));
    if (it == files_.end()) {
        throw FileSystemError(path, "cannot open for reading");
    }
    return it->second.content;
}

void MemoryFileSystem::writeFile(const std::string& path, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto p = normalize(path);
    auto parent = parentOf(p);
    if (!dirs_.count(parent)) {
        throw FileSystemError(p, "parent directory does not exist");
    }
    if (matchesAny(failWrites_, p) || readOnly_.count(parent)) {
        throw FileSystemError(p, "write failed (injected)");
    }
    files_[p] = FileNode{content, now()};
    ++writes_;
}

bool MemoryFileSystem::removeFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto p = normalize(path);
    auto it = files_.find(p);
    if (it == files_.end()) {
        return false;
    }
    if (matchesAny(failRemoves_, p) || readOnly_.count(parentOf(p))) {
        throw FileSystemError(p, "remove failed (injected)");
    }
    files_.erase(it);
    return true;
}

std::vector<std::string> MemoryFileSystem::listDirectory(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto p = normalize(path);
    if (!dirs_.count(p)) {
        throw FileSystemError(p, "cannot list directory");
    }
    std::vector<std::string> names;
    for (const auto& [filePath, node] : files_) {
        if (parentOf(filePath) == p) {
            names.push_back(std::filesystem::path(filePath).filename().string());
        }
    }
    for (const auto& dir : dirs_) {
        if (dir != p && dir != "/" && dir != "." && parentOf(dir) == p) {
            names.push_back(std::filesystem::path(dir).filename().string());
        }
    }
    return names;
}

uint64_t MemoryFileSystem::fileSize(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(normalize(path));
    if (it == files_.end()) {
        throw FileSystemError(path, "file_size failed");
    }
    return it->second.content.size();
}

util::TimePoint MemoryFileSystem::lastWriteTime(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(normalize(path));
    if (it == files_.end()) {
        throw FileSystemError(path, "stat failed");
    }
    return it->second.mtime;
}

bool MemoryFileSystem::isWritable(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto p = normalize(path);
    return dirs_.count(p) > 0 && readOnly_.count(p) == 0 && !matchesAny(failWrites_, p);
}

void MemoryFileSystem::failWritesUnder(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    failWrites_.insert(normalize(prefix));
}

void MemoryFileSystem::failRemovesUnder(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    failRemoves_.insert(normalize(prefix));
}

void MemoryFileSystem::failCreateDirectory(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    failMkdirs_.insert(normalize(path));
}

void MemoryFileSystem::setReadOnly(const std::string& dir, bool readOnly) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (readOnly) {
        readOnly_.insert(normalize(dir));
    } else {
        readOnly_.erase(normalize(dir));
    }
}

void MemoryFileSystem::setLastWriteTime(const std::string& path, util::TimePoint tp) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(normalize(path));
    if (it == files_.end()) {
        throw FileSystemError(path, "no such file");
    }
    it->second.mtime = tp;
}

void MemoryFileSystem::clearFailures() {
    std::lock_guard<std::mutex> lock(mutex_);
    failWrites_.clear();
    failRemoves_.clear();
    failMkdirs_.clear();
    readOnly_.clear();
}

size_t MemoryFileSystem::fileCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.size();
}

size_t MemoryFileSystem::writeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

} // namespace fs
} // namespace core
} // namespace offcache
