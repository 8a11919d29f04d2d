#pragma once

#include <taskfed/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace taskfed::config {

enum class BackendKind { Filesystem, Memory, PostgreSQL, MongoDB };

const char* toString(BackendKind kind);
std::optional<BackendKind> parseBackendKind(std::string_view value);

struct FilesystemOptions {
    std::string dataDirectory;
    std::optional<int> backupRetentionDays;
    std::optional<bool> enableCompression;
};

struct MemoryOptions {
    std::optional<int64_t> maxSize; // entry count
    std::optional<bool> persistToDisk;
    std::optional<std::string> persistPath;
};

struct PostgresOptions {
    std::string host;
    int port = 5432;
    std::string database;
    std::string user;
    std::string password;
    std::optional<bool> ssl;
    std::optional<int> maxConnections;
    std::optional<int> connectionTimeout;
    std::optional<int> idleTimeout;
};

struct MongoOptions {
    std::string uri;
    std::string database;
    std::optional<std::string> collection;
    std::optional<int> maxPoolSize;
    std::optional<int> minPoolSize;
    std::optional<int> connectTimeout;
    std::optional<int> socketTimeout;
};

using BackendOptions = std::variant<FilesystemOptions, MemoryOptions, PostgresOptions, MongoOptions>;

/**
 * One configured data source.
 *
 * Higher priority is preferred both for routing and for priority-based
 * conflict resolution. Tags restrict which project tags route here.
 */
struct SourceConfig {
    std::string id;
    std::string name;
    BackendKind type = BackendKind::Filesystem;
    int priority = 0;
    bool readonly = false;
    bool enabled = true;
    std::vector<std::string> tags;
    BackendOptions options = FilesystemOptions{};

    bool hasTag(std::string_view tag) const;
};

/**
 * Conflict resolution strategies for multi-source aggregation
 *
 * Manual and Merge have no implementation of their own: Manual resolves like
 * Priority and Merge resolves like Latest.
 */
enum class ConflictResolutionStrategy { Latest, Priority, Manual, Merge };

const char* toString(ConflictResolutionStrategy strategy);

// Strict parse; nullopt for unknown names
std::optional<ConflictResolutionStrategy> tryParseConflictResolutionStrategy(std::string_view value);

// Lenient parse; unknown names log a warning and fall back to Priority
ConflictResolutionStrategy parseConflictResolutionStrategy(std::string_view value);

struct RouterConfig {
    Duration healthCheckInterval{60000};
    int maxFailures = 3;
    Duration operationTimeout{30000};
    bool enableFallback = true;
    Duration recoveryCheckDelay{5000};
};

struct AggregatorConfig {
    ConflictResolutionStrategy conflictResolution = ConflictResolutionStrategy::Priority;
    Duration queryTimeout{30000};
    bool parallelQueries = true;
};

/**
 * Complete federation configuration as stored in data-sources.json
 */
struct MultiSourceConfig {
    std::vector<SourceConfig> sources;
    ConflictResolutionStrategy conflictResolution = ConflictResolutionStrategy::Latest;
    bool aggregationEnabled = false;
    Duration operationTimeout{30000};
    int maxRetries = 3;
    bool allowPartialFailure = true;

    // "router" section
    Duration healthCheckInterval{60000};
    int maxFailures = 3;
    bool enableFallback = true;
    Duration recoveryCheckDelay{5000};
    bool parallelQueries = true;

    RouterConfig routerConfig() const;
    AggregatorConfig aggregatorConfig() const;
};

/**
 * Default configuration: one filesystem source at ./data with priority 100
 */
MultiSourceConfig defaultMultiSourceConfig();

Result<void> validateSourceConfig(const SourceConfig& source);

/**
 * Validate a complete configuration.
 *
 * Requires at least one source, unique ids, a positive operation timeout and
 * non-negative retries, plus every per-source rule.
 */
Result<void> validateMultiSourceConfig(const MultiSourceConfig& config);

/**
 * Parse JSON into a configuration. Missing optional fields take their
 * defaults; malformed fields and unknown enum names are ConfigurationError.
 * The result is not validated.
 */
Result<MultiSourceConfig> parseMultiSourceConfig(const nlohmann::json& j);
Result<SourceConfig> parseSourceConfig(const nlohmann::json& j);

nlohmann::json toJson(const SourceConfig& source);
nlohmann::json toJson(const MultiSourceConfig& config);

} // namespace taskfed::config
