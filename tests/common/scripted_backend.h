#pragma once

#include <taskfed/core/format.h>
#include <taskfed/storage/storage_backend.h>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <map>
#include <set>
#include <stdexcept>
#include <string>

namespace taskfed::tests {

/**
 * In-test backend with scriptable failures, delays and call counters.
 *
 * Data operations (load/save/remove/list) fail while `failRemaining` is
 * positive (decremented per call) or while `failAlways` is set; with
 * `throwOnCall` they throw instead. Keys in `failLoadKeys` / `throwLoadKeys`
 * fail or throw on load only. A positive `delay` suspends each data
 * operation on a timer and then honours the stop token.
 */
class ScriptedBackend : public storage::IStorageBackend {
public:
    explicit ScriptedBackend(std::string name = "scripted") : name_(std::move(name)) {}

    // Stored data
    std::map<std::string, model::TaskList> lists;

    // Failure injection
    int failRemaining = 0;
    bool failAlways = false;
    bool throwOnCall = false;
    std::set<std::string> failLoadKeys;
    std::set<std::string> throwLoadKeys;
    bool failList = false;
    bool failInitialize = false;
    bool throwOnInitialize = false;
    bool healthy = true;
    bool throwOnHealthCheck = false;
    bool throwOnShutdown = false;
    Duration delay{0};
    Duration initializeDelay{0};
    Duration healthDelay{0};

    // Counters
    int initializeCalls = 0;
    int healthChecks = 0;
    int loadCalls = 0;
    int saveCalls = 0;
    int removeCalls = 0;
    int listCalls = 0;
    int shutdownCalls = 0;
    int cancelledCalls = 0;
    std::string lastRemovedKey;
    bool lastRemovePermanent = false;

    int dataCalls() const { return loadCalls + saveCalls + removeCalls + listCalls; }

    void put(const model::TaskList& list) { lists[list.id] = list; }

    boost::asio::awaitable<Result<void>> initialize() override {
        ++initializeCalls;
        if (initializeDelay.count() > 0) {
            co_await sleep(initializeDelay);
        }
        if (throwOnInitialize) {
            throw std::runtime_error(name_ + ": initialize exploded");
        }
        if (failInitialize) {
            co_return Error{ErrorCode::NotInitialized, name_ + ": initialize failed"};
        }
        co_return Result<void>{};
    }

    boost::asio::awaitable<bool> healthCheck() override {
        ++healthChecks;
        if (healthDelay.count() > 0) {
            co_await sleep(healthDelay);
        }
        if (throwOnHealthCheck) {
            throw std::runtime_error(name_ + ": health check exploded");
        }
        co_return healthy;
    }

    boost::asio::awaitable<Result<std::optional<model::TaskList>>>
    load(std::string key, storage::LoadOptions options, std::stop_token stop) override {
        ++loadCalls;
        if (auto r = co_await script("load", stop); !r) {
            co_return r.error();
        }
        if (failLoadKeys.count(key)) {
            co_return Error{ErrorCode::CorruptedData, format("{}: cannot load '{}'", name_, key)};
        }
        if (throwLoadKeys.count(key)) {
            throw std::runtime_error(format("{}: reading '{}' exploded", name_, key));
        }
        auto it = lists.find(key);
        if (it == lists.end() || (it->second.isArchived && !options.includeArchived)) {
            co_return std::optional<model::TaskList>{};
        }
        co_return std::optional<model::TaskList>(it->second);
    }

    boost::asio::awaitable<Result<void>> save(std::string key, model::TaskList list,
                                              storage::SaveOptions, std::stop_token stop) override {
        ++saveCalls;
        if (auto r = co_await script("save", stop); !r) {
            co_return r;
        }
        lists[key] = std::move(list);
        co_return Result<void>{};
    }

    boost::asio::awaitable<Result<void>> remove(std::string key, bool permanent,
                                                std::stop_token stop) override {
        ++removeCalls;
        lastRemovedKey = key;
        lastRemovePermanent = permanent;
        if (auto r = co_await script("remove", stop); !r) {
            co_return r;
        }
        auto it = lists.find(key);
        if (it == lists.end()) {
            co_return Error{ErrorCode::NotFound, format("{}: '{}' not found", name_, key)};
        }
        if (permanent) {
            lists.erase(it);
        } else {
            it->second.isArchived = true;
        }
        co_return Result<void>{};
    }

    boost::asio::awaitable<Result<std::vector<model::TaskListSummary>>>
    list(storage::ListOptions options, std::stop_token stop) override {
        ++listCalls;
        if (auto r = co_await script("list", stop); !r) {
            co_return r.error();
        }
        if (failList) {
            co_return Error{ErrorCode::SourceOperationFailed, name_ + ": list failed"};
        }
        std::vector<model::TaskListSummary> out;
        for (const auto& [id, list] : lists) {
            if (list.isArchived && !options.includeArchived) {
                continue;
            }
            out.push_back(model::summarize(list));
        }
        co_return out;
    }

    boost::asio::awaitable<void> shutdown() override {
        ++shutdownCalls;
        if (throwOnShutdown) {
            throw std::runtime_error(name_ + ": shutdown exploded");
        }
        co_return;
    }

    std::string getType() const override { return "scripted"; }

private:
    static boost::asio::awaitable<void> sleep(Duration d) {
        boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
        timer.expires_after(d);
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    boost::asio::awaitable<Result<void>> script(const char* what, const std::stop_token& stop) {
        if (delay.count() > 0) {
            co_await sleep(delay);
            if (stop.stop_requested()) {
                ++cancelledCalls;
                co_return Error{ErrorCode::OperationCancelled, format("{}: {} cancelled", name_, what)};
            }
        }
        if (throwOnCall) {
            throw std::runtime_error(format("{}: {} exploded", name_, what));
        }
        if (failAlways) {
            co_return Error{ErrorCode::WriteError, format("{}: {} failed", name_, what)};
        }
        if (failRemaining > 0) {
            --failRemaining;
            co_return Error{ErrorCode::WriteError, format("{}: {} failed", name_, what)};
        }
        co_return Result<void>{};
    }

    std::string name_;
};

} // namespace taskfed::tests
