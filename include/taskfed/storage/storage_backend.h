#pragma once

#include <taskfed/core/types.h>
#include <taskfed/model/task_list.h>

#include <boost/asio/awaitable.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace taskfed::config {
struct SourceConfig;
}

namespace taskfed::storage {

struct LoadOptions {
    bool includeArchived = false;
    std::optional<std::string> projectTag; // routing hint; single backends ignore it
};

struct SaveOptions {
    bool backup = false;   // keep a copy of the previous version
    bool validate = true;  // run model::validateTaskList before persisting
};

struct ListOptions {
    std::optional<std::string> projectTag;
    std::optional<std::string> context; // deprecated alias of projectTag
    bool includeArchived = false;
    std::optional<size_t> limit;
    std::optional<size_t> offset;
};

/**
 * Abstract interface for task list storage backends
 *
 * Every operation is a coroutine running on the caller's executor. Operations
 * that touch stored data take a stop token: when the caller gives up on the
 * call (timeout, shutdown) it requests a stop and the backend should return
 * ErrorCode::OperationCancelled at its next check instead of completing.
 */
class IStorageBackend {
public:
    virtual ~IStorageBackend() = default;

    /**
     * Prepare the backend for use (create directories, open connections)
     */
    virtual boost::asio::awaitable<Result<void>> initialize() { co_return Result<void>{}; }

    /**
     * Probe the backend. Throwing counts as unhealthy.
     */
    virtual boost::asio::awaitable<bool> healthCheck() = 0;

    /**
     * Load a task list by key. A missing list is a successful empty result.
     */
    virtual boost::asio::awaitable<Result<std::optional<model::TaskList>>>
    load(std::string key, LoadOptions options, std::stop_token stop) = 0;

    virtual boost::asio::awaitable<Result<void>>
    save(std::string key, model::TaskList list, SaveOptions options, std::stop_token stop) = 0;

    /**
     * Delete a task list. Non-permanent deletes archive the list.
     */
    virtual boost::asio::awaitable<Result<void>> remove(std::string key, bool permanent,
                                                        std::stop_token stop) = 0;

    virtual boost::asio::awaitable<Result<std::vector<model::TaskListSummary>>>
    list(ListOptions options, std::stop_token stop) = 0;

    virtual boost::asio::awaitable<void> shutdown() { co_return; }

    /**
     * Get backend type identifier
     */
    virtual std::string getType() const = 0;
};

/**
 * Factory for creating storage backends from source configuration
 */
class StorageBackendFactory {
public:
    using Creator =
        std::function<Result<std::shared_ptr<IStorageBackend>>(const config::SourceConfig&)>;

    /**
     * Create an uninitialized backend for a configured source.
     *
     * Custom registered kinds are checked first, then the built-in
     * filesystem and memory backends. Database kinds are accepted by the
     * configuration layer but have no implementation: NotSupported.
     */
    static Result<std::shared_ptr<IStorageBackend>> create(const config::SourceConfig& source);

    /**
     * Register a custom backend implementation for a type name
     */
    static void registerBackend(const std::string& type, Creator creator);

    static void unregisterBackend(const std::string& type);

    template <typename Backend,
              typename = std::enable_if_t<std::is_base_of_v<IStorageBackend, Backend>>>
    static void registerBackendType(const std::string& type) {
        registerBackend(type, [](const config::SourceConfig&) -> Result<std::shared_ptr<IStorageBackend>> {
            return std::shared_ptr<IStorageBackend>(std::make_shared<Backend>());
        });
    }
};

/// Stop token check used between backend steps
inline Result<void> checkCancelled(const std::stop_token& stop, std::string_view what) {
    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, std::string(what) + " cancelled"};
    }
    return {};
}

} // namespace taskfed::storage
