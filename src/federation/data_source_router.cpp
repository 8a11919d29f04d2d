#include <taskfed/core/format.h>
#include <taskfed/federation/data_source_router.h>
#include <taskfed/federation/with_timeout.h>

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <exception>

namespace taskfed::federation {

namespace {

using boost::asio::awaitable;
using model::TaskList;
using storage::IStorageBackend;

using BackendPtr = std::shared_ptr<IStorageBackend>;
using ReadResult = Result<std::optional<TaskList>>;

awaitable<ReadResult> loadFrom(BackendPtr backend, std::string key, storage::LoadOptions options,
                               std::stop_token stop) {
    co_return co_await backend->load(std::move(key), options, std::move(stop));
}

awaitable<ReadResult> saveTo(BackendPtr backend, std::string key, TaskList list,
                             storage::SaveOptions options, std::stop_token stop) {
    auto result = co_await backend->save(std::move(key), std::move(list), options, std::move(stop));
    if (!result) {
        co_return result.error();
    }
    co_return std::optional<TaskList>{};
}

awaitable<ReadResult> removeFrom(BackendPtr backend, std::string key, bool permanent,
                                 std::stop_token stop) {
    auto result = co_await backend->remove(std::move(key), permanent, std::move(stop));
    if (!result) {
        co_return result.error();
    }
    co_return std::optional<TaskList>{};
}

awaitable<Result<void>> initializeBackend(BackendPtr backend) {
    co_return co_await backend->initialize();
}

awaitable<Result<bool>> probeBackend(BackendPtr backend) {
    bool healthy = co_await backend->healthCheck();
    co_return healthy;
}

// Build and initialize one backend, each step bounded by `timeout`
awaitable<Result<BackendPtr>> buildBackend(const config::SourceConfig& source,
                                           const DataSourceRouter::BackendCreator& creator,
                                           Duration timeout) {
    std::optional<Result<BackendPtr>> created;
    try {
        created.emplace(creator(source));
    } catch (const std::exception& e) {
        created.emplace(Error{ErrorCode::SourceOperationFailed,
                              format("Creating backend for '{}' threw: {}", source.id, e.what())});
    }
    if (!*created) {
        co_return created->error();
    }
    BackendPtr backend = std::move(*created).value();
    if (!backend) {
        co_return Error{ErrorCode::InternalError,
                        format("Backend factory returned nothing for '{}'", source.id)};
    }

    auto init = co_await runWithTimeout<void>(
        timeout, [backend](std::stop_token) { return initializeBackend(backend); },
        format("Initializing source '{}'", source.id));
    if (!init) {
        co_return init.error();
    }
    co_return backend;
}

bool probeSucceeded(const Result<bool>& probe) {
    return probe.has_value() && probe.value();
}

} // namespace

const char* toString(OperationType type) {
    switch (type) {
        case OperationType::Read:
            return "read";
        case OperationType::Write:
            return "write";
        case OperationType::Delete:
            return "delete";
    }
    return "unknown";
}

DataSourceRouter::DataSourceRouter(std::vector<config::SourceConfig> sources,
                                   config::RouterConfig config, Dependencies deps)
    : sources_(std::move(sources)), config_(config), deps_(std::move(deps)),
      stopRequested_(std::make_shared<std::atomic<bool>>(false)) {
    if (!deps_.createBackend) {
        deps_.createBackend = [](const config::SourceConfig& source) {
            return storage::StorageBackendFactory::create(source);
        };
    }
    std::stable_sort(sources_.begin(), sources_.end(),
                     [](const config::SourceConfig& a, const config::SourceConfig& b) {
                         return a.priority > b.priority;
                     });
}

DataSourceRouter::~DataSourceRouter() {
    stopRequested_->store(true, std::memory_order_release);
    if (healthTimer_) {
        healthTimer_->cancel();
    }
    for (auto& [id, timer] : recheckTimers_) {
        timer->cancel();
    }
}

awaitable<void> DataSourceRouter::initialize() {
    if (initialized_) {
        co_return;
    }
    initialized_ = true;

    spdlog::info("[DataSourceRouter] Initializing {} configured source(s)", sources_.size());

    std::vector<const config::SourceConfig*> enabled;
    for (const auto& source : sources_) {
        if (!source.enabled) {
            spdlog::debug("[DataSourceRouter] Skipping disabled source '{}'", source.id);
            continue;
        }
        enabled.push_back(&source);
    }

    // All sources start together; slots keep priority order. Every child
    // finishes before initialize() returns.
    struct InitState {
        InitState(const boost::asio::any_io_executor& ex, size_t count)
            : signal(ex), pending(count), slots(count) {
            signal.expires_at(boost::asio::steady_timer::time_point::max());
        }

        boost::asio::steady_timer signal;
        size_t pending;
        std::vector<std::shared_ptr<PoolEntry>> slots;
    };

    auto executor = co_await boost::asio::this_coro::executor;
    auto state = std::make_shared<InitState>(executor, enabled.size());
    for (size_t i = 0; i < enabled.size(); ++i) {
        boost::asio::co_spawn(
            executor,
            [this, state, i, source = *enabled[i]]() -> awaitable<void> {
                state->slots[i] = co_await createEntry(source);
                if (--state->pending == 0) {
                    state->signal.cancel();
                }
            },
            boost::asio::detached);
    }
    if (state->pending > 0) {
        boost::system::error_code ec;
        co_await state->signal.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    pool_ = std::move(state->slots);

    auto healthy = std::count_if(pool_.begin(), pool_.end(),
                                 [](const auto& entry) { return entry->healthy; });
    spdlog::info("[DataSourceRouter] Initialized: {} source(s), {} healthy", pool_.size(),
                 healthy);

    startHealthChecks();
}

awaitable<std::shared_ptr<PoolEntry>>
DataSourceRouter::createEntry(const config::SourceConfig& source) {
    auto entry = std::make_shared<PoolEntry>();
    entry->config = source;
    entry->lastHealthCheck = std::chrono::system_clock::now();

    auto built = co_await buildBackend(source, deps_.createBackend, config_.operationTimeout);
    if (!built) {
        spdlog::error("[DataSourceRouter] Failed to initialize source '{}': {}", source.id,
                      built.error().message);
        entry->healthy = false;
        entry->failureCount = config_.maxFailures;
        co_return entry;
    }

    entry->backend = std::move(built).value();
    auto probe = co_await runWithTimeout<bool>(
        config_.operationTimeout,
        [backend = entry->backend](std::stop_token) { return probeBackend(backend); },
        format("Health check of '{}'", source.id));
    entry->healthy = probeSucceeded(probe);
    entry->lastHealthCheck = std::chrono::system_clock::now();

    if (entry->healthy) {
        spdlog::info("[DataSourceRouter] Source '{}' ({}) ready, priority {}", source.id,
                     config::toString(source.type), source.priority);
    } else {
        spdlog::warn("[DataSourceRouter] Source '{}' failed its initial health check{}", source.id,
                     probe ? "" : format(": {}", probe.error().message));
    }
    co_return entry;
}

std::vector<std::shared_ptr<PoolEntry>>
DataSourceRouter::selectSources(const Operation& operation, const OperationContext& context) const {
    std::vector<std::shared_ptr<PoolEntry>> candidates;
    for (const auto& entry : pool_) {
        if (entry->healthy && entry->backend) {
            candidates.push_back(entry);
        }
    }

    if (context.projectTag && !context.projectTag->empty()) {
        std::vector<std::shared_ptr<PoolEntry>> tagged;
        for (const auto& entry : candidates) {
            if (entry->config.hasTag(*context.projectTag)) {
                tagged.push_back(entry);
            }
        }
        // Tags are a preference: fall back to every healthy source
        if (!tagged.empty()) {
            candidates = std::move(tagged);
        }
    }

    if (operation.type != OperationType::Read || context.requireWritable) {
        std::erase_if(candidates, [](const auto& entry) { return entry->config.readonly; });
    }

    std::stable_sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
        return a->config.priority > b->config.priority;
    });
    return candidates;
}

awaitable<ReadResult> DataSourceRouter::routeOperation(Operation operation,
                                                       OperationContext context) {
    if (isShuttingDown()) {
        co_return Error{ErrorCode::SystemShutdown, "Router is shutting down"};
    }
    if (operation.key.empty()) {
        co_return Error{ErrorCode::InvalidArgument,
                        format("{} operation requires a key", toString(operation.type))};
    }
    if (operation.type == OperationType::Write && !operation.data) {
        co_return Error{ErrorCode::InvalidArgument,
                        format("Write of '{}' carries no data", operation.key)};
    }

    auto sources = selectSources(operation, context);
    if (sources.empty()) {
        spdlog::warn("[DataSourceRouter] No available source for {} of '{}'",
                     toString(operation.type), operation.key);
        co_return Error{ErrorCode::NoAvailableSource,
                        format("No available data source for {} operation on '{}'",
                               toString(operation.type), operation.key)};
    }

    spdlog::debug("[DataSourceRouter] Routing {} of '{}' to {} candidate(s), primary '{}'",
                  toString(operation.type), operation.key, sources.size(),
                  sources.front()->config.id);

    if (operation.type == OperationType::Read) {
        co_return co_await executeRead(operation, sources);
    }
    co_return co_await executeMutation(operation, sources);
}

awaitable<ReadResult> DataSourceRouter::attempt(const std::shared_ptr<PoolEntry>& entry,
                                                const Operation& operation) {
    auto backend = entry->backend;
    auto what = format("{} of '{}' on source '{}'", toString(operation.type), operation.key,
                       entry->config.id);

    StoppableOp<std::optional<TaskList>> op;
    switch (operation.type) {
        case OperationType::Read:
            op = [backend, key = operation.key, options = operation.loadOptions](
                     std::stop_token stop) { return loadFrom(backend, key, options, stop); };
            break;
        case OperationType::Write:
            op = [backend, key = operation.key, list = *operation.data,
                  options = operation.saveOptions](std::stop_token stop) {
                return saveTo(backend, key, list, options, stop);
            };
            break;
        case OperationType::Delete:
            op = [backend, key = operation.key, permanent = operation.permanent](
                     std::stop_token stop) { return removeFrom(backend, key, permanent, stop); };
            break;
    }

    auto result = co_await runWithTimeout<std::optional<TaskList>>(config_.operationTimeout,
                                                                  std::move(op), std::move(what));
    if (result) {
        entry->failureCount = 0;
    } else {
        recordFailure(entry, result.error());
    }
    co_return result;
}

awaitable<ReadResult>
DataSourceRouter::executeRead(const Operation& operation,
                              const std::vector<std::shared_ptr<PoolEntry>>& sources) {
    std::vector<std::string> failures;
    for (const auto& entry : sources) {
        auto result = co_await attempt(entry, operation);
        if (result) {
            co_return result;
        }
        failures.push_back(format("{}: {}", entry->config.id, result.error().message));
        if (!config_.enableFallback) {
            break;
        }
        spdlog::debug("[DataSourceRouter] Read of '{}' failed on '{}', trying next source",
                      operation.key, entry->config.id);
    }

    std::string summary;
    for (const auto& failure : failures) {
        if (!summary.empty()) {
            summary += "; ";
        }
        summary += failure;
    }
    spdlog::error("[DataSourceRouter] Read of '{}' failed on every source: {}", operation.key,
                  summary);
    co_return Error{ErrorCode::ReadExhausted,
                    format("Read of '{}' failed on all sources: {}", operation.key, summary)};
}

awaitable<ReadResult>
DataSourceRouter::executeMutation(const Operation& operation,
                                  const std::vector<std::shared_ptr<PoolEntry>>& sources) {
    const auto& primary = sources.front();
    auto primaryResult = co_await attempt(primary, operation);
    if (primaryResult) {
        co_return primaryResult;
    }

    const Error primaryError = primaryResult.error();
    spdlog::warn("[DataSourceRouter] {} of '{}' failed on primary '{}': {}",
                 toString(operation.type), operation.key, primary->config.id,
                 primaryError.message);

    if (config_.enableFallback && sources.size() > 1) {
        for (size_t i = 1; i < sources.size(); ++i) {
            const auto& fallback = sources[i];
            auto result = co_await attempt(fallback, operation);
            if (result) {
                spdlog::info("[DataSourceRouter] {} of '{}' succeeded on fallback '{}'",
                             toString(operation.type), operation.key, fallback->config.id);
                co_return result;
            }
            spdlog::warn("[DataSourceRouter] {} of '{}' failed on fallback '{}': {}",
                         toString(operation.type), operation.key, fallback->config.id,
                         result.error().message);
        }
    }

    co_return primaryError;
}

awaitable<ReadResult> DataSourceRouter::read(std::string key, OperationContext context,
                                             storage::LoadOptions options) {
    Operation operation;
    operation.type = OperationType::Read;
    operation.key = std::move(key);
    operation.loadOptions = options;
    co_return co_await routeOperation(std::move(operation), std::move(context));
}

awaitable<Result<void>> DataSourceRouter::write(std::string key, TaskList list,
                                                OperationContext context,
                                                storage::SaveOptions options) {
    Operation operation;
    operation.type = OperationType::Write;
    operation.key = std::move(key);
    operation.data = std::move(list);
    operation.saveOptions = options;
    auto result = co_await routeOperation(std::move(operation), std::move(context));
    if (!result) {
        co_return result.error();
    }
    co_return Result<void>{};
}

awaitable<Result<void>> DataSourceRouter::remove(std::string key, bool permanent,
                                                 OperationContext context) {
    Operation operation;
    operation.type = OperationType::Delete;
    operation.key = std::move(key);
    operation.permanent = permanent;
    auto result = co_await routeOperation(std::move(operation), std::move(context));
    if (!result) {
        co_return result.error();
    }
    co_return Result<void>{};
}

void DataSourceRouter::recordFailure(const std::shared_ptr<PoolEntry>& entry, const Error& error) {
    ++entry->failureCount;
    spdlog::debug("[DataSourceRouter] Source '{}' failure {}/{}: {}", entry->config.id,
                  entry->failureCount, config_.maxFailures, error.message);

    if (entry->healthy && entry->failureCount >= config_.maxFailures) {
        entry->healthy = false;
        spdlog::warn("[DataSourceRouter] Source '{}' marked unhealthy after {} failure(s)",
                     entry->config.id, entry->failureCount);
        scheduleRecheck(entry);
    }
}

void DataSourceRouter::scheduleRecheck(const std::shared_ptr<PoolEntry>& entry) {
    if (stopRequested_->load(std::memory_order_acquire) || !deps_.executor) {
        return;
    }

    auto& slot = recheckTimers_[entry->config.id];
    if (slot) {
        slot->cancel();
    }
    slot = std::make_shared<boost::asio::steady_timer>(deps_.executor);
    slot->expires_after(config_.recoveryCheckDelay);

    boost::asio::co_spawn(
        deps_.executor,
        [timer = slot, entry, creator = deps_.createBackend, timeout = config_.operationTimeout,
         stop = stopRequested_]() -> awaitable<void> {
            boost::system::error_code ec;
            co_await timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec || stop->load(std::memory_order_acquire)) {
                co_return;
            }
            co_await checkSourceHealth(entry, creator, timeout, stop);
        },
        boost::asio::detached);
}

void DataSourceRouter::startHealthChecks() {
    if (!deps_.executor || config_.healthCheckInterval.count() <= 0) {
        spdlog::debug("[DataSourceRouter] Periodic health checks disabled");
        return;
    }

    healthTimer_ = std::make_shared<boost::asio::steady_timer>(deps_.executor);

    // The loop holds copies of everything it touches so it never outlives `this`
    boost::asio::co_spawn(
        deps_.executor,
        [timer = healthTimer_, stop = stopRequested_, pool = pool_,
         creator = deps_.createBackend, interval = config_.healthCheckInterval,
         timeout = config_.operationTimeout]() -> awaitable<void> {
            while (!stop->load(std::memory_order_acquire)) {
                timer->expires_after(interval);
                boost::system::error_code ec;
                co_await timer->async_wait(
                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                if (ec || stop->load(std::memory_order_acquire)) {
                    break;
                }
                for (const auto& entry : pool) {
                    if (stop->load(std::memory_order_acquire)) {
                        break;
                    }
                    co_await checkSourceHealth(entry, creator, timeout, stop);
                }
            }
            spdlog::debug("[DataSourceRouter] Health check loop stopped");
        },
        boost::asio::detached);
}

awaitable<void> DataSourceRouter::runHealthChecks() {
    auto pool = pool_;
    for (const auto& entry : pool) {
        if (stopRequested_->load(std::memory_order_acquire)) {
            break;
        }
        co_await checkSourceHealth(entry, deps_.createBackend, config_.operationTimeout,
                                   stopRequested_);
    }
}

awaitable<void> DataSourceRouter::checkSourceHealth(std::shared_ptr<PoolEntry> entry,
                                                    BackendCreator creator, Duration timeout,
                                                    std::shared_ptr<std::atomic<bool>> stop) {
    if (stop->load(std::memory_order_acquire)) {
        co_return;
    }

    if (!entry->backend) {
        auto built = co_await buildBackend(entry->config, creator, timeout);
        entry->lastHealthCheck = std::chrono::system_clock::now();
        if (!built) {
            spdlog::debug("[DataSourceRouter] Source '{}' still unavailable: {}",
                          entry->config.id, built.error().message);
            co_return;
        }
        if (stop->load(std::memory_order_acquire)) {
            co_await built.value()->shutdown();
            co_return;
        }
        entry->backend = std::move(built).value();
        spdlog::info("[DataSourceRouter] Reconnected source '{}'", entry->config.id);
    }

    auto probe = co_await runWithTimeout<bool>(
        timeout, [backend = entry->backend](std::stop_token) { return probeBackend(backend); },
        format("Health check of '{}'", entry->config.id));
    if (stop->load(std::memory_order_acquire)) {
        co_return;
    }

    const bool healthy = probeSucceeded(probe);
    const bool wasHealthy = entry->healthy;
    entry->healthy = healthy;
    entry->lastHealthCheck = std::chrono::system_clock::now();

    if (healthy && !wasHealthy) {
        spdlog::info("[DataSourceRouter] Source '{}' recovered", entry->config.id);
        entry->failureCount = 0;
    } else if (!healthy && wasHealthy) {
        spdlog::warn("[DataSourceRouter] Source '{}' became unhealthy{}", entry->config.id,
                     probe ? "" : format(": {}", probe.error().message));
    }
}

awaitable<void> DataSourceRouter::shutdown() {
    bool expected = false;
    if (!shuttingDown_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        co_return;
    }

    spdlog::info("[DataSourceRouter] Shutting down {} source(s)", pool_.size());
    stopRequested_->store(true, std::memory_order_release);

    if (healthTimer_) {
        healthTimer_->cancel();
    }
    for (auto& [id, timer] : recheckTimers_) {
        timer->cancel();
    }
    recheckTimers_.clear();

    for (const auto& entry : pool_) {
        if (!entry->backend) {
            continue;
        }
        try {
            co_await entry->backend->shutdown();
        } catch (const std::exception& e) {
            spdlog::error("[DataSourceRouter] Error shutting down source '{}': {}",
                          entry->config.id, e.what());
        }
    }
    pool_.clear();
    spdlog::info("[DataSourceRouter] Shutdown complete");
}

RouterStatus DataSourceRouter::getStatus() const {
    RouterStatus status;
    status.total = pool_.size();
    for (const auto& entry : pool_) {
        SourceStatus source;
        source.id = entry->config.id;
        source.name = entry->config.name;
        source.type = entry->config.type;
        source.healthy = entry->healthy;
        source.readonly = entry->config.readonly;
        source.priority = entry->config.priority;
        source.failureCount = entry->failureCount;
        source.lastHealthCheck = entry->lastHealthCheck;
        source.tags = entry->config.tags;
        if (source.healthy) {
            ++status.healthy;
        } else {
            ++status.unhealthy;
        }
        status.sources.push_back(std::move(source));
    }
    return status;
}

std::vector<AggregationSource> DataSourceRouter::getActiveSources() const {
    std::vector<AggregationSource> active;
    for (const auto& entry : pool_) {
        if (entry->healthy && entry->backend) {
            active.push_back(AggregationSource{entry->backend, entry->config.id,
                                               entry->config.name, entry->config.priority});
        }
    }
    return active;
}

} // namespace taskfed::federation
