#pragma once

#include <taskfed/storage/storage_backend.h>

#include <filesystem>
#include <mutex>

namespace taskfed::storage {

/**
 * Filesystem backend: one JSON document per task list
 *
 * Layout under the data directory:
 *   lists/<key>.json                  current version
 *   lists/<key>.json.backup           previous version while a save is in flight
 *   backups/<key>_deleted_<ms>.json   copy taken before a permanent delete
 *
 * Saves go through a temporary file and rename so a reader never observes a
 * partially written document.
 */
class FileStorageBackend : public IStorageBackend {
public:
    struct Config {
        std::filesystem::path dataDirectory;
        int backupRetentionDays = 7;
    };

    explicit FileStorageBackend(Config config);

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

    std::string getType() const override { return "filesystem"; }

    std::filesystem::path listsDirectory() const { return config_.dataDirectory / "lists"; }
    std::filesystem::path backupsDirectory() const { return config_.dataDirectory / "backups"; }

private:
    Result<std::filesystem::path> getListPath(std::string_view key) const;
    Result<std::optional<model::TaskList>> readList(const std::filesystem::path& path) const;
    Result<void> writeList(const std::filesystem::path& path, const model::TaskList& list,
                           bool keepBackup) const;
    void pruneOldBackups() const;

    Config config_;
    std::mutex writeMutex_;
    bool initialized_ = false;
};

} // namespace taskfed::storage
