#include "core/cache/storage/PayloadStore.hpp"
#include "core/util/Hash.hpp"
#include <utility>

namespace offcache {
namespace core {
namespace cache {

namespace {

constexpr const char* PAYLOAD_EXTENSION = ".json";

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

PayloadStore::PayloadStore(std::shared_ptr<CacheContext> context)
    : context_(std::move(context)) {}

std::string PayloadStore::hash(const nlohmann::json& content) {
    // Строка хэшируется как есть, остальное: компактный dump (ключи объекта отсортированы)
    const std::string canonical = content.is_string() ? content.get<std::string>() : content.dump();
    return util::sha256Hex(canonical);
}

std::string PayloadStore::filePath(const std::string& hash) const {
    return context_->paths.payloadFile(hash);
}

SaveResult PayloadStore::save(const nlohmann::json& data,
                              const std::string& source,
                              const std::string& type,
                              const std::optional<nlohmann::json>& metadata) {
    SaveResult result;
    try {
        result.hash = hash(data);
        result.filePath = filePath(result.hash);
        auto& files = context_->files();

        if (files.exists(result.filePath)) {
            context_->log().info("PayloadStore: payload {} уже в кэше, пропуск", result.hash);
            result.success = true;
            result.deduplicated = true;
            return result;
        }

        CachedPayload payload;
        payload.hash = result.hash;
        payload.data = data;
        payload.source = source;
        payload.type = type;
        payload.cachedAt = context_->now();
        payload.metadata = metadata;

        files.writeFile(result.filePath, payload.toJson().dump(2));
        context_->log().info("PayloadStore: сохранён payload {} из {} (type: {})", result.hash, source, type);
        result.success = true;
    } catch (const std::exception& e) {
        context_->log().error("PayloadStore: ошибка сохранения payload: {}", e.what());
        result.success = false;
        result.hash.clear();
        result.filePath.clear();
        result.error = e.what();
    }
    return result;
}

LoadResult PayloadStore::load(const std::string& hash) const {
    LoadResult result;
    const std::string path = filePath(hash);
    auto& files = context_->files();

    std::string content;
    try {
        if (!files.exists(path)) {
            result.status = LoadStatus::NotFound;
            result.error = "Payload " + hash + " not found in cache";
            return result;
        }
        content = files.readFile(path);
    } catch (const std::exception& e) {
        // Файл мог исчезнуть между проверкой и чтением
        if (!files.exists(path)) {
            result.status = LoadStatus::NotFound;
            result.error = "Payload " + hash + " not found in cache";
            return result;
        }
        context_->log().error("PayloadStore: ошибка чтения payload {}: {}", hash, e.what());
        result.status = LoadStatus::IoError;
        result.error = e.what();
        return result;
    }

    try {
        result.payload = CachedPayload::fromJson(nlohmann::json::parse(content));
    } catch (const std::exception& e) {
        context_->log().error("PayloadStore: повреждённый payload {}: {}", hash, e.what());
        result.status = LoadStatus::ParseError;
        result.error = std::string("Failed to parse payload ") + hash + ": " + e.what();
        return result;
    }

    context_->log().debug("PayloadStore: загружен payload {}", hash);
    result.success = true;
    result.status = LoadStatus::Ok;
    return result;
}

DeleteStatus PayloadStore::removeWithStatus(const std::string& hash) {
    const std::string path = filePath(hash);
    try {
        if (!context_->files().removeFile(path)) {
            context_->log().warn("PayloadStore: payload {} не найден, удалять нечего", hash);
            return DeleteStatus::NotFound;
        }
        context_->log().info("PayloadStore: удалён payload {}", hash);
        return DeleteStatus::Deleted;
    } catch (const std::exception& e) {
        context_->log().error("PayloadStore: ошибка удаления payload {}: {}", hash, e.what());
        return DeleteStatus::Failed;
    }
}

bool PayloadStore::remove(const std::string& hash) {
    return removeWithStatus(hash) == DeleteStatus::Deleted;
}

bool PayloadStore::exists(const std::string& hash) const {
    try {
        return context_->files().exists(filePath(hash));
    } catch (const std::exception&) {
        return false;
    }
}

int64_t PayloadStore::size(const std::string& hash) const {
    const std::string path = filePath(hash);
    try {
        if (!context_->files().exists(path)) {
            return -1;
        }
        return static_cast<int64_t>(context_->files().fileSize(path));
    } catch (const std::exception& e) {
        context_->log().debug("PayloadStore: размер {} недоступен: {}", hash, e.what());
        return -1;
    }
}

std::vector<std::string> PayloadStore::listAll() const {
    std::vector<std::string> hashes;
    try {
        auto& files = context_->files();
        if (!files.isDirectory(context_->paths.offlineCache)) {
            return hashes;
        }
        for (const auto& name : files.listDirectory(context_->paths.offlineCache)) {
            if (!endsWith(name, PAYLOAD_EXTENSION) || name == INDEX_FILE) {
                continue;
            }
            hashes.push_back(name.substr(0, name.size() - std::string(PAYLOAD_EXTENSION).size()));
        }
    } catch (const std::exception& e) {
        context_->log().warn("PayloadStore: не удалось получить список payload: {}", e.what());
    }
    return hashes;
}

} // namespace cache
} // namespace core
} // namespace offcache
