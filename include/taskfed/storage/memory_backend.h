#pragma once

#include <taskfed/storage/storage_backend.h>

#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace taskfed::storage {

/**
 * In-memory storage backend for development and testing
 *
 * Lists are copied in and out so callers never share state with the store.
 * Saving with backup keeps the most recent kMaxBackups previous versions per
 * key; backups are never listed.
 */
class MemoryStorageBackend : public IStorageBackend {
public:
    static constexpr size_t kMaxBackups = 3;

    struct Config {
        std::optional<size_t> maxSize; // max stored lists
    };

    MemoryStorageBackend() = default;
    explicit MemoryStorageBackend(Config config) : config_(config) {}

    boost::asio::awaitable<Result<void>> initialize() override;
    boost::asio::awaitable<bool> healthCheck() override;
    boost::asio::awaitable<Result<std::optional<model::TaskList>>>
    load(std::string key, LoadOptions options, std::stop_token stop) override;
    boost::asio::awaitable<Result<void>> save(std::string key, model::TaskList list,
                                              SaveOptions options, std::stop_token stop) override;
    boost::asio::awaitable<Result<void>> remove(std::string key, bool permanent,
                                                std::stop_token stop) override;
    boost::asio::awaitable<Result<std::vector<model::TaskListSummary>>>
    list(ListOptions options, std::stop_token stop) override;
    boost::asio::awaitable<void> shutdown() override;

    std::string getType() const override { return "memory"; }

    size_t size() const;
    size_t backupCount(const std::string& key) const;

private:
    struct Backup {
        TimePoint takenAt;
        model::TaskList list;
    };

    Result<void> ensureInitialized() const;

    Config config_;
    mutable std::mutex mutex_;
    bool initialized_ = false;
    std::map<std::string, model::TaskList> data_;
    std::unordered_map<std::string, std::deque<Backup>> backups_;
};

} // namespace taskfed::storage
