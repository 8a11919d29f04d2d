#include <taskfed/core/format.h>
#include <taskfed/storage/memory_backend.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace taskfed::storage {

Result<void> MemoryStorageBackend::ensureInitialized() const {
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Memory storage backend not initialized"};
    }
    return {};
}

boost::asio::awaitable<Result<void>> MemoryStorageBackend::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        data_.clear();
        backups_.clear();
        initialized_ = true;
        spdlog::info("[MemoryStorage] Initialized");
    }
    co_return Result<void>{};
}

boost::asio::awaitable<bool> MemoryStorageBackend::healthCheck() {
    std::lock_guard<std::mutex> lock(mutex_);
    co_return initialized_;
}

boost::asio::awaitable<Result<std::optional<model::TaskList>>>
MemoryStorageBackend::load(std::string key, LoadOptions options, std::stop_token stop) {
    if (auto c = checkCancelled(stop, "load"); !c) {
        co_return c.error();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto r = ensureInitialized(); !r) {
        co_return r.error();
    }

    auto it = data_.find(key);
    if (it == data_.end() || (it->second.isArchived && !options.includeArchived)) {
        co_return std::optional<model::TaskList>{};
    }
    spdlog::debug("[MemoryStorage] Loaded '{}'", key);
    co_return std::optional<model::TaskList>(it->second);
}

boost::asio::awaitable<Result<void>> MemoryStorageBackend::save(std::string key,
                                                                model::TaskList list,
                                                                SaveOptions options,
                                                                std::stop_token stop) {
    if (auto c = checkCancelled(stop, "save"); !c) {
        co_return c;
    }
    if (options.validate) {
        if (auto v = model::validateTaskList(list); !v) {
            co_return v;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (auto r = ensureInitialized(); !r) {
        co_return r;
    }

    auto it = data_.find(key);
    if (it == data_.end() && config_.maxSize && data_.size() >= *config_.maxSize) {
        co_return Error{ErrorCode::ResourceExhausted,
                        format("Memory storage full ({} lists)", *config_.maxSize)};
    }

    if (options.backup && it != data_.end()) {
        auto& history = backups_[key];
        history.push_back(Backup{std::chrono::system_clock::now(), it->second});
        while (history.size() > kMaxBackups) {
            history.pop_front();
        }
    }

    data_[key] = std::move(list);
    spdlog::debug("[MemoryStorage] Saved '{}' ({} lists stored)", key, data_.size());
    co_return Result<void>{};
}

boost::asio::awaitable<Result<void>> MemoryStorageBackend::remove(std::string key, bool permanent,
                                                                  std::stop_token stop) {
    if (auto c = checkCancelled(stop, "delete"); !c) {
        co_return c;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto r = ensureInitialized(); !r) {
        co_return r;
    }

    auto it = data_.find(key);
    if (it == data_.end()) {
        co_return Error{ErrorCode::NotFound, format("Task list not found: {}", key)};
    }

    if (permanent) {
        data_.erase(it);
        backups_.erase(key);
        spdlog::info("[MemoryStorage] Permanently deleted '{}'", key);
    } else {
        it->second.isArchived = true;
        it->second.updatedAt = std::chrono::system_clock::now();
        spdlog::info("[MemoryStorage] Archived '{}'", key);
    }
    co_return Result<void>{};
}

boost::asio::awaitable<Result<std::vector<model::TaskListSummary>>>
MemoryStorageBackend::list(ListOptions options, std::stop_token stop) {
    if (auto c = checkCancelled(stop, "list"); !c) {
        co_return c.error();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto r = ensureInitialized(); !r) {
        co_return r.error();
    }

    std::vector<model::TaskListSummary> summaries;
    for (const auto& [key, list] : data_) {
        if (list.isArchived && !options.includeArchived) {
            continue;
        }
        if (options.context && list.context != *options.context) {
            continue;
        }
        auto summary = model::summarize(list);
        if (options.projectTag && summary.projectTag != *options.projectTag) {
            continue;
        }
        summaries.push_back(std::move(summary));
    }

    size_t offset = std::min(options.offset.value_or(0), summaries.size());
    summaries.erase(summaries.begin(), summaries.begin() + static_cast<std::ptrdiff_t>(offset));
    if (options.limit && *options.limit > 0 && summaries.size() > *options.limit) {
        summaries.resize(*options.limit);
    }
    co_return summaries;
}

boost::asio::awaitable<void> MemoryStorageBackend::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();
    backups_.clear();
    initialized_ = false;
    spdlog::info("[MemoryStorage] Shut down");
    co_return;
}

size_t MemoryStorageBackend::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

size_t MemoryStorageBackend::backupCount(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = backups_.find(key);
    return it == backups_.end() ? 0 : it->second.size();
}

} // namespace taskfed::storage
