#include <taskfed/config/data_source_config.h>
#include <taskfed/core/format.h>
#include <taskfed/storage/file_backend.h>
#include <taskfed/storage/memory_backend.h>
#include <taskfed/storage/storage_backend.h>

#include <spdlog/spdlog.h>

#include <mutex>
#include <unordered_map>

namespace taskfed::storage {

namespace {

// Registry for custom backends
struct BackendRegistry {
    std::mutex mutex;
    std::unordered_map<std::string, StorageBackendFactory::Creator> creators;
};

BackendRegistry& getBackendRegistry() {
    static BackendRegistry registry;
    return registry;
}

} // namespace

Result<std::shared_ptr<IStorageBackend>>
StorageBackendFactory::create(const config::SourceConfig& source) {
    const std::string type = config::toString(source.type);

    {
        auto& registry = getBackendRegistry();
        std::lock_guard<std::mutex> lock(registry.mutex);
        if (auto it = registry.creators.find(type); it != registry.creators.end()) {
            return it->second(source);
        }
    }

    switch (source.type) {
        case config::BackendKind::Filesystem: {
            auto* options = std::get_if<config::FilesystemOptions>(&source.options);
            if (!options || options->dataDirectory.empty()) {
                return Error{ErrorCode::ConfigurationError,
                             format("Source '{}' has no dataDirectory", source.id)};
            }
            FileStorageBackend::Config cfg;
            cfg.dataDirectory = options->dataDirectory;
            cfg.backupRetentionDays = options->backupRetentionDays.value_or(7);
            return std::shared_ptr<IStorageBackend>(std::make_shared<FileStorageBackend>(cfg));
        }
        case config::BackendKind::Memory: {
            MemoryStorageBackend::Config cfg;
            if (auto* options = std::get_if<config::MemoryOptions>(&source.options)) {
                if (options->maxSize) {
                    cfg.maxSize = static_cast<size_t>(*options->maxSize);
                }
                if (options->persistToDisk.value_or(false)) {
                    spdlog::warn("[StorageFactory] Source '{}': persistToDisk is not supported "
                                 "by the memory backend, ignoring",
                                 source.id);
                }
            }
            return std::shared_ptr<IStorageBackend>(std::make_shared<MemoryStorageBackend>(cfg));
        }
        case config::BackendKind::PostgreSQL:
        case config::BackendKind::MongoDB:
            break;
    }

    spdlog::error("[StorageFactory] No implementation for backend type '{}' (source '{}')", type,
                  source.id);
    return Error{ErrorCode::NotSupported,
                 format("Storage backend type '{}' is not available", type)};
}

void StorageBackendFactory::registerBackend(const std::string& type, Creator creator) {
    auto& registry = getBackendRegistry();
    std::lock_guard<std::mutex> lock(registry.mutex);
    registry.creators[type] = std::move(creator);
}

void StorageBackendFactory::unregisterBackend(const std::string& type) {
    auto& registry = getBackendRegistry();
    std::lock_guard<std::mutex> lock(registry.mutex);
    registry.creators.erase(type);
}

} // namespace taskfed::storage
