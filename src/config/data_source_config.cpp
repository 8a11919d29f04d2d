#include <taskfed/config/data_source_config.h>
#include <taskfed/core/format.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace taskfed::config {

using nlohmann::json;

namespace {

template <typename T> std::optional<T> optionalField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

template <typename T> void putOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

Duration durationField(const json& j, const char* key, Duration fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    return Duration(it->get<int64_t>());
}

BackendOptions parseOptions(BackendKind kind, const json& cfg) {
    switch (kind) {
        case BackendKind::Filesystem: {
            FilesystemOptions o;
            o.dataDirectory = cfg.value("dataDirectory", std::string{});
            o.backupRetentionDays = optionalField<int>(cfg, "backupRetentionDays");
            o.enableCompression = optionalField<bool>(cfg, "enableCompression");
            return o;
        }
        case BackendKind::Memory: {
            MemoryOptions o;
            o.maxSize = optionalField<int64_t>(cfg, "maxSize");
            o.persistToDisk = optionalField<bool>(cfg, "persistToDisk");
            o.persistPath = optionalField<std::string>(cfg, "persistPath");
            return o;
        }
        case BackendKind::PostgreSQL: {
            PostgresOptions o;
            o.host = cfg.value("host", std::string{});
            o.port = cfg.value("port", 5432);
            o.database = cfg.value("database", std::string{});
            o.user = cfg.value("user", std::string{});
            o.password = cfg.value("password", std::string{});
            o.ssl = optionalField<bool>(cfg, "ssl");
            o.maxConnections = optionalField<int>(cfg, "maxConnections");
            o.connectionTimeout = optionalField<int>(cfg, "connectionTimeout");
            o.idleTimeout = optionalField<int>(cfg, "idleTimeout");
            return o;
        }
        case BackendKind::MongoDB: {
            MongoOptions o;
            o.uri = cfg.value("uri", std::string{});
            o.database = cfg.value("database", std::string{});
            o.collection = optionalField<std::string>(cfg, "collection");
            o.maxPoolSize = optionalField<int>(cfg, "maxPoolSize");
            o.minPoolSize = optionalField<int>(cfg, "minPoolSize");
            o.connectTimeout = optionalField<int>(cfg, "connectTimeout");
            o.socketTimeout = optionalField<int>(cfg, "socketTimeout");
            return o;
        }
    }
    return FilesystemOptions{};
}

json optionsToJson(const BackendOptions& options) {
    json j = json::object();
    if (auto* fs = std::get_if<FilesystemOptions>(&options)) {
        j["dataDirectory"] = fs->dataDirectory;
        putOptional(j, "backupRetentionDays", fs->backupRetentionDays);
        putOptional(j, "enableCompression", fs->enableCompression);
    } else if (auto* mem = std::get_if<MemoryOptions>(&options)) {
        putOptional(j, "maxSize", mem->maxSize);
        putOptional(j, "persistToDisk", mem->persistToDisk);
        putOptional(j, "persistPath", mem->persistPath);
    } else if (auto* pg = std::get_if<PostgresOptions>(&options)) {
        j["host"] = pg->host;
        j["port"] = pg->port;
        j["database"] = pg->database;
        j["user"] = pg->user;
        j["password"] = pg->password;
        putOptional(j, "ssl", pg->ssl);
        putOptional(j, "maxConnections", pg->maxConnections);
        putOptional(j, "connectionTimeout", pg->connectionTimeout);
        putOptional(j, "idleTimeout", pg->idleTimeout);
    } else if (auto* mongo = std::get_if<MongoOptions>(&options)) {
        j["uri"] = mongo->uri;
        j["database"] = mongo->database;
        putOptional(j, "collection", mongo->collection);
        putOptional(j, "maxPoolSize", mongo->maxPoolSize);
        putOptional(j, "minPoolSize", mongo->minPoolSize);
        putOptional(j, "connectTimeout", mongo->connectTimeout);
        putOptional(j, "socketTimeout", mongo->socketTimeout);
    }
    return j;
}

Error configError(const std::string& message) {
    return Error{ErrorCode::ConfigurationError, message};
}

bool positive(const std::optional<int>& v) {
    return !v || *v > 0;
}

} // namespace

const char* toString(BackendKind kind) {
    switch (kind) {
        case BackendKind::Filesystem: return "filesystem";
        case BackendKind::Memory: return "memory";
        case BackendKind::PostgreSQL: return "postgresql";
        case BackendKind::MongoDB: return "mongodb";
    }
    return "filesystem";
}

std::optional<BackendKind> parseBackendKind(std::string_view value) {
    if (value == "filesystem")
        return BackendKind::Filesystem;
    if (value == "memory")
        return BackendKind::Memory;
    if (value == "postgresql")
        return BackendKind::PostgreSQL;
    if (value == "mongodb")
        return BackendKind::MongoDB;
    return std::nullopt;
}

bool SourceConfig::hasTag(std::string_view tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

const char* toString(ConflictResolutionStrategy strategy) {
    switch (strategy) {
        case ConflictResolutionStrategy::Latest: return "latest";
        case ConflictResolutionStrategy::Priority: return "priority";
        case ConflictResolutionStrategy::Manual: return "manual";
        case ConflictResolutionStrategy::Merge: return "merge";
    }
    return "priority";
}

std::optional<ConflictResolutionStrategy> tryParseConflictResolutionStrategy(std::string_view value) {
    if (value == "latest")
        return ConflictResolutionStrategy::Latest;
    if (value == "priority")
        return ConflictResolutionStrategy::Priority;
    if (value == "manual")
        return ConflictResolutionStrategy::Manual;
    if (value == "merge")
        return ConflictResolutionStrategy::Merge;
    return std::nullopt;
}

ConflictResolutionStrategy parseConflictResolutionStrategy(std::string_view value) {
    if (auto strategy = tryParseConflictResolutionStrategy(value)) {
        return *strategy;
    }
    spdlog::warn("[Config] Unknown conflict resolution strategy '{}', using priority", value);
    return ConflictResolutionStrategy::Priority;
}

RouterConfig MultiSourceConfig::routerConfig() const {
    RouterConfig rc;
    rc.healthCheckInterval = healthCheckInterval;
    rc.maxFailures = maxFailures;
    rc.operationTimeout = operationTimeout;
    rc.enableFallback = enableFallback;
    rc.recoveryCheckDelay = recoveryCheckDelay;
    return rc;
}

AggregatorConfig MultiSourceConfig::aggregatorConfig() const {
    AggregatorConfig ac;
    ac.conflictResolution = conflictResolution;
    ac.queryTimeout = operationTimeout;
    ac.parallelQueries = parallelQueries;
    return ac;
}

MultiSourceConfig defaultMultiSourceConfig() {
    SourceConfig source;
    source.id = "default-file";
    source.name = "Default File Storage";
    source.type = BackendKind::Filesystem;
    source.priority = 100;
    FilesystemOptions fs;
    fs.dataDirectory = "./data";
    fs.backupRetentionDays = 7;
    fs.enableCompression = false;
    source.options = fs;

    MultiSourceConfig config;
    config.sources.push_back(std::move(source));
    return config;
}

Result<void> validateSourceConfig(const SourceConfig& source) {
    if (source.id.empty()) {
        return configError("source id must not be empty");
    }
    if (source.name.empty()) {
        return configError(format("source '{}': name must not be empty", source.id));
    }
    if (source.priority < 0) {
        return configError(format("source '{}': priority must be >= 0", source.id));
    }

    auto mismatch = [&]() {
        return configError(
            format("source '{}': options do not match type {}", source.id, toString(source.type)));
    };

    switch (source.type) {
        case BackendKind::Filesystem: {
            auto* o = std::get_if<FilesystemOptions>(&source.options);
            if (!o)
                return mismatch();
            if (o->dataDirectory.empty())
                return configError(format("source '{}': dataDirectory is required", source.id));
            if (!positive(o->backupRetentionDays))
                return configError(
                    format("source '{}': backupRetentionDays must be positive", source.id));
            break;
        }
        case BackendKind::Memory: {
            auto* o = std::get_if<MemoryOptions>(&source.options);
            if (!o)
                return mismatch();
            if (o->maxSize && *o->maxSize <= 0)
                return configError(format("source '{}': maxSize must be positive", source.id));
            break;
        }
        case BackendKind::PostgreSQL: {
            auto* o = std::get_if<PostgresOptions>(&source.options);
            if (!o)
                return mismatch();
            if (o->host.empty() || o->database.empty() || o->user.empty())
                return configError(
                    format("source '{}': host, database and user are required", source.id));
            if (o->port < 1 || o->port > 65535)
                return configError(format("source '{}': port {} out of range", source.id, o->port));
            if (!positive(o->maxConnections) || !positive(o->connectionTimeout) ||
                !positive(o->idleTimeout))
                return configError(format("source '{}': pool settings must be positive", source.id));
            break;
        }
        case BackendKind::MongoDB: {
            auto* o = std::get_if<MongoOptions>(&source.options);
            if (!o)
                return mismatch();
            if (o->uri.empty() || o->database.empty())
                return configError(format("source '{}': uri and database are required", source.id));
            if (!positive(o->maxPoolSize) || !positive(o->connectTimeout) ||
                !positive(o->socketTimeout) || (o->minPoolSize && *o->minPoolSize < 0))
                return configError(format("source '{}': pool settings out of range", source.id));
            break;
        }
    }
    return {};
}

Result<void> validateMultiSourceConfig(const MultiSourceConfig& config) {
    if (config.sources.empty()) {
        return configError("at least one data source is required");
    }

    std::unordered_set<std::string> ids;
    for (const auto& source : config.sources) {
        if (auto r = validateSourceConfig(source); !r) {
            return r;
        }
        if (!ids.insert(source.id).second) {
            return configError(format("duplicate source id '{}'", source.id));
        }
    }

    if (config.operationTimeout.count() <= 0) {
        return configError("operationTimeout must be positive");
    }
    if (config.maxRetries < 0) {
        return configError("maxRetries must be >= 0");
    }
    if (config.healthCheckInterval.count() <= 0 || config.recoveryCheckDelay.count() <= 0) {
        return configError("router intervals must be positive");
    }
    if (config.maxFailures < 1) {
        return configError("router.maxFailures must be >= 1");
    }
    return {};
}

Result<SourceConfig> parseSourceConfig(const json& j) {
    try {
        if (!j.is_object()) {
            return configError("source entry must be an object");
        }
        SourceConfig source;
        source.id = j.value("id", std::string{});
        source.name = j.value("name", std::string{});

        auto typeName = j.value("type", std::string{"filesystem"});
        auto kind = parseBackendKind(typeName);
        if (!kind) {
            return configError(
                format("source '{}': unsupported data source type '{}'", source.id, typeName));
        }
        source.type = *kind;
        source.priority = j.value("priority", 0);
        source.readonly = j.value("readonly", false);
        source.enabled = j.value("enabled", true);
        source.tags = j.value("tags", std::vector<std::string>{});
        source.options = parseOptions(source.type, j.value("config", json::object()));
        return source;
    } catch (const json::exception& e) {
        return configError(format("invalid source entry: {}", e.what()));
    }
}

Result<MultiSourceConfig> parseMultiSourceConfig(const json& j) {
    if (!j.is_object()) {
        return configError("configuration root must be an object");
    }

    MultiSourceConfig config;
    try {
        if (auto it = j.find("sources"); it != j.end()) {
            if (!it->is_array()) {
                return configError("'sources' must be an array");
            }
            for (const auto& entry : *it) {
                auto source = parseSourceConfig(entry);
                if (!source) {
                    return source.error();
                }
                config.sources.push_back(std::move(source).value());
            }
        }

        if (auto it = j.find("conflictResolution"); it != j.end()) {
            auto name = it->get<std::string>();
            auto strategy = tryParseConflictResolutionStrategy(name);
            if (!strategy) {
                return configError(format("unknown conflictResolution '{}'", name));
            }
            config.conflictResolution = *strategy;
        }

        config.aggregationEnabled = j.value("aggregationEnabled", config.aggregationEnabled);
        config.operationTimeout = durationField(j, "operationTimeout", config.operationTimeout);
        config.maxRetries = j.value("maxRetries", config.maxRetries);
        config.allowPartialFailure = j.value("allowPartialFailure", config.allowPartialFailure);

        if (auto it = j.find("router"); it != j.end() && it->is_object()) {
            const auto& r = *it;
            config.healthCheckInterval =
                durationField(r, "healthCheckInterval", config.healthCheckInterval);
            config.maxFailures = r.value("maxFailures", config.maxFailures);
            config.enableFallback = r.value("enableFallback", config.enableFallback);
            config.recoveryCheckDelay =
                durationField(r, "recoveryCheckDelay", config.recoveryCheckDelay);
            config.parallelQueries = r.value("parallelQueries", config.parallelQueries);
        }
    } catch (const json::exception& e) {
        return configError(format("invalid configuration: {}", e.what()));
    }
    return config;
}

json toJson(const SourceConfig& source) {
    json j{{"id", source.id},
           {"name", source.name},
           {"type", toString(source.type)},
           {"priority", source.priority},
           {"readonly", source.readonly},
           {"enabled", source.enabled},
           {"config", optionsToJson(source.options)}};
    if (!source.tags.empty()) {
        j["tags"] = source.tags;
    }
    return j;
}

json toJson(const MultiSourceConfig& config) {
    json sources = json::array();
    for (const auto& source : config.sources) {
        sources.push_back(toJson(source));
    }
    return json{{"sources", std::move(sources)},
                {"conflictResolution", toString(config.conflictResolution)},
                {"aggregationEnabled", config.aggregationEnabled},
                {"operationTimeout", config.operationTimeout.count()},
                {"maxRetries", config.maxRetries},
                {"allowPartialFailure", config.allowPartialFailure},
                {"router",
                 {{"healthCheckInterval", config.healthCheckInterval.count()},
                  {"maxFailures", config.maxFailures},
                  {"enableFallback", config.enableFallback},
                  {"recoveryCheckDelay", config.recoveryCheckDelay.count()},
                  {"parallelQueries", config.parallelQueries}}}};
}

} // namespace taskfed::config
