#pragma once

#include <taskfed/config/data_source_config.h>
#include <taskfed/core/types.h>
#include <taskfed/federation/multi_source_aggregator.h>
#include <taskfed/model/task_list.h>
#include <taskfed/storage/storage_backend.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace taskfed::federation {

enum class OperationType { Read, Write, Delete };

const char* toString(OperationType type);

/**
 * Single-entity operation routed to one source (with fallback)
 */
struct Operation {
    OperationType type = OperationType::Read;
    std::string key;
    std::optional<model::TaskList> data; // required for writes
    bool permanent = false;              // deletes only
    storage::LoadOptions loadOptions;
    storage::SaveOptions saveOptions;
};

struct OperationContext {
    std::optional<std::string> projectTag; // preferred, not required
    std::optional<std::string> listId;
    bool requireWritable = false;
};

/**
 * Live state for one configured source. Owned by the router.
 */
struct PoolEntry {
    std::shared_ptr<storage::IStorageBackend> backend; // null until construction succeeds
    config::SourceConfig config;
    bool healthy = false;
    TimePoint lastHealthCheck{};
    int failureCount = 0;
};

struct SourceStatus {
    std::string id;
    std::string name;
    config::BackendKind type = config::BackendKind::Filesystem;
    bool healthy = false;
    bool readonly = false;
    int priority = 0;
    int failureCount = 0;
    TimePoint lastHealthCheck{};
    std::vector<std::string> tags;
};

struct RouterStatus {
    size_t total = 0;
    size_t healthy = 0;
    size_t unhealthy = 0;
    std::vector<SourceStatus> sources;
};

/**
 * @brief Routes single-entity operations across configured storage sources.
 *
 * ## Source selection
 * Healthy entries, narrowed to those tagged with the context's project tag
 * when any are, without read-only entries for writes and deletes, ordered by
 * priority (highest first).
 *
 * ## Execution
 * - Reads try candidates in order and return the first success. A missing
 *   list is a success. With fallback disabled only the first candidate is
 *   tried. Exhaustion yields ReadExhausted listing every failure.
 * - Writes and deletes go to the first candidate; on failure, and with
 *   fallback enabled, the remaining candidates are tried in order. When all
 *   fail the primary's error is returned.
 * Every attempt is bounded by operationTimeout; a timed-out backend call is
 * asked to stop through its stop token.
 *
 * ## Health
 * Each failed attempt increments the entry's failure count. Reaching
 * maxFailures marks the entry unhealthy and schedules a recheck after
 * recoveryCheckDelay. A periodic loop re-checks every entry each
 * healthCheckInterval; recovering entries have their failure count reset.
 * Entries whose backend could not be built are rebuilt during health checks.
 *
 * ## Threading
 * All coroutines must run on the executor passed in Dependencies, and that
 * executor must not run handlers concurrently (single-threaded io_context or
 * a strand). Pool state is not locked.
 */
class DataSourceRouter {
public:
    using BackendCreator = std::function<Result<std::shared_ptr<storage::IStorageBackend>>(
        const config::SourceConfig&)>;

    struct Dependencies {
        boost::asio::any_io_executor executor;
        /// Defaults to StorageBackendFactory::create
        BackendCreator createBackend;
    };

    DataSourceRouter(std::vector<config::SourceConfig> sources, config::RouterConfig config,
                     Dependencies deps);
    ~DataSourceRouter();

    DataSourceRouter(const DataSourceRouter&) = delete;
    DataSourceRouter& operator=(const DataSourceRouter&) = delete;

    /**
     * @brief Build, initialize and health-check every enabled source, then
     *        start the periodic health loop.
     *
     * Sources are set up concurrently and the pool keeps priority order.
     * Never fails: sources that cannot be built or initialized enter the pool
     * unhealthy with failureCount preset to maxFailures.
     */
    boost::asio::awaitable<void> initialize();

    /**
     * @brief Route one operation.
     * @return The loaded list for reads (nullopt when not found), nullopt for
     *         writes and deletes
     */
    boost::asio::awaitable<Result<std::optional<model::TaskList>>>
    routeOperation(Operation operation, OperationContext context = {});

    boost::asio::awaitable<Result<std::optional<model::TaskList>>>
    read(std::string key, OperationContext context = {}, storage::LoadOptions options = {});

    boost::asio::awaitable<Result<void>> write(std::string key, model::TaskList list,
                                               OperationContext context = {},
                                               storage::SaveOptions options = {});

    boost::asio::awaitable<Result<void>> remove(std::string key, bool permanent = false,
                                                OperationContext context = {});

    /**
     * @brief Stop health checking, shut down every backend and clear the pool.
     * Idempotent. Backend shutdown errors are logged, never raised.
     */
    boost::asio::awaitable<void> shutdown();

    RouterStatus getStatus() const;

    /**
     * @brief Healthy sources in priority order, ready for aggregation.
     */
    std::vector<AggregationSource> getActiveSources() const;

    /**
     * @brief Re-check every pooled source now (the periodic loop does the same).
     */
    boost::asio::awaitable<void> runHealthChecks();

    const config::RouterConfig& getConfig() const { return config_; }
    bool isShuttingDown() const { return shuttingDown_.load(std::memory_order_acquire); }

private:
    std::vector<std::shared_ptr<PoolEntry>> selectSources(const Operation& operation,
                                                          const OperationContext& context) const;

    boost::asio::awaitable<Result<std::optional<model::TaskList>>>
    executeRead(const Operation& operation, const std::vector<std::shared_ptr<PoolEntry>>& sources);

    boost::asio::awaitable<Result<std::optional<model::TaskList>>>
    executeMutation(const Operation& operation,
                    const std::vector<std::shared_ptr<PoolEntry>>& sources);

    boost::asio::awaitable<Result<std::optional<model::TaskList>>>
    attempt(const std::shared_ptr<PoolEntry>& entry, const Operation& operation);

    boost::asio::awaitable<std::shared_ptr<PoolEntry>>
    createEntry(const config::SourceConfig& source);

    void recordFailure(const std::shared_ptr<PoolEntry>& entry, const Error& error);
    void scheduleRecheck(const std::shared_ptr<PoolEntry>& entry);
    void startHealthChecks();

    static boost::asio::awaitable<void>
    checkSourceHealth(std::shared_ptr<PoolEntry> entry, BackendCreator creator, Duration timeout,
                      std::shared_ptr<std::atomic<bool>> stop);

    std::vector<config::SourceConfig> sources_;
    config::RouterConfig config_;
    Dependencies deps_;

    std::vector<std::shared_ptr<PoolEntry>> pool_; // priority order
    std::shared_ptr<std::atomic<bool>> stopRequested_;
    std::atomic<bool> shuttingDown_{false};
    bool initialized_ = false;

    std::shared_ptr<boost::asio::steady_timer> healthTimer_;
    std::unordered_map<std::string, std::shared_ptr<boost::asio::steady_timer>> recheckTimers_;
};

} // namespace taskfed::federation
