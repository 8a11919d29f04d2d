#include <taskfed/config/config_helpers.h>
#include <taskfed/config/data_source_loader.h>
#include <taskfed/core/format.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace taskfed::config {

namespace fs = std::filesystem;

namespace {

Error configError(const std::string& message) {
    return Error{ErrorCode::ConfigurationError, message};
}

} // namespace

std::vector<fs::path> DataSourceConfigLoader::defaultSearchPaths() {
    return {fs::path("config") / "data-sources.json", fs::path(".taskfed") / "data-sources.json",
            get_config_dir() / "data-sources.json"};
}

Result<MultiSourceConfig> DataSourceConfigLoader::load(const LoaderOptions& options) const {
    std::optional<MultiSourceConfig> config;

    if (options.configPath) {
        auto r = loadFromFile(*options.configPath);
        if (!r) {
            return r.error();
        }
        config = std::move(r).value();
        if (!config && options.requireConfigFile) {
            return Error{ErrorCode::FileNotFound,
                         format("Required configuration file not found: {}",
                                options.configPath->string())};
        }
    }

    if (!config) {
        auto paths = options.searchPaths ? *options.searchPaths : defaultSearchPaths();
        for (const auto& path : paths) {
            auto r = loadFromFile(path);
            if (!r) {
                return r.error();
            }
            if (r.value()) {
                config = std::move(r).value();
                break;
            }
        }
    }

    if (!config && options.useEnvironment) {
        auto r = loadFromEnvironment(options.envPrefix);
        if (!r) {
            return r.error();
        }
        config = std::move(r).value();
    }

    if (!config) {
        spdlog::info("[ConfigLoader] No configuration found, using defaults");
        config = defaultMultiSourceConfig();
    }

    if (options.useEnvironment) {
        applyEnvironmentOverrides(*config, options.envPrefix);
    }

    if (auto v = validateMultiSourceConfig(*config); !v) {
        return v.error();
    }

    size_t enabled = std::count_if(config->sources.begin(), config->sources.end(),
                                   [](const SourceConfig& s) { return s.enabled; });
    spdlog::info("[ConfigLoader] Loaded {} data sources ({} enabled, aggregation {})",
                 config->sources.size(), enabled, config->aggregationEnabled ? "on" : "off");
    return std::move(*config);
}

Result<std::optional<MultiSourceConfig>>
DataSourceConfigLoader::loadFromFile(const fs::path& path) const {
    std::error_code ec;
    auto resolved = fs::absolute(path, ec);
    if (ec) {
        resolved = path;
    }
    if (!fs::exists(resolved, ec)) {
        spdlog::debug("[ConfigLoader] Configuration file not found: {}", resolved.string());
        return std::optional<MultiSourceConfig>{};
    }

    auto ext = resolved.extension().string();
    if (ext == ".yaml" || ext == ".yml") {
        return configError(format("Failed to load configuration from {}: YAML configuration is not "
                                  "supported, convert it to JSON",
                                  path.string()));
    }

    std::ifstream in(resolved);
    if (!in) {
        return Error{ErrorCode::PermissionDenied,
                     format("Cannot open configuration file {}", resolved.string())};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::error("[ConfigLoader] Invalid JSON in {}: {}", resolved.string(), e.what());
        return configError(
            format("Invalid JSON in configuration file {}: {}", path.string(), e.what()));
    }

    auto parsed = parseMultiSourceConfig(doc);
    if (!parsed) {
        return configError(
            format("Failed to load configuration from {}: {}", path.string(), parsed.error().message));
    }

    spdlog::info("[ConfigLoader] Configuration loaded from {}", resolved.string());
    return std::optional<MultiSourceConfig>(std::move(parsed).value());
}

Result<std::optional<MultiSourceConfig>>
DataSourceConfigLoader::loadFromEnvironment(const std::string& prefix) const {
    auto countKey = prefix + "_COUNT";
    if (!get_env(countKey)) {
        return std::optional<MultiSourceConfig>{};
    }

    auto count = get_env_int(countKey, 0);
    if (!count || count.value() < 1) {
        return configError(format("Invalid {}: must be a positive integer", countKey));
    }

    MultiSourceConfig config;
    for (int i = 0; i < static_cast<int>(count.value()); ++i) {
        auto source = loadSourceFromEnvironment(prefix, i);
        if (!source) {
            return source.error();
        }
        config.sources.push_back(std::move(source).value());
    }

    config.conflictResolution =
        parseConflictResolutionStrategy(get_env_or(prefix + "_CONFLICT_RESOLUTION", "latest"));
    config.aggregationEnabled = get_env_bool(prefix + "_AGGREGATION_ENABLED", false);

    auto timeout = get_env_int(prefix + "_OPERATION_TIMEOUT", 30000);
    if (!timeout) {
        return timeout.error();
    }
    config.operationTimeout = Duration(timeout.value());

    auto retries = get_env_int(prefix + "_MAX_RETRIES", 3);
    if (!retries) {
        return retries.error();
    }
    config.maxRetries = static_cast<int>(retries.value());
    config.allowPartialFailure = get_env_bool(prefix + "_ALLOW_PARTIAL_FAILURE", true);

    spdlog::info("[ConfigLoader] Configuration loaded from environment ({} sources)",
                 config.sources.size());
    return std::optional<MultiSourceConfig>(std::move(config));
}

Result<SourceConfig> DataSourceConfigLoader::loadSourceFromEnvironment(const std::string& prefix,
                                                                       int index) const {
    const std::string p = format("{}_{}", prefix, index);

    SourceConfig source;
    source.id = get_env_or(p + "_ID", format("source-{}", index));
    source.name = get_env_or(p + "_NAME", format("Source {}", index));

    auto typeName = get_env_or(p + "_TYPE", "filesystem");
    auto kind = parseBackendKind(typeName);
    if (!kind) {
        return configError(format("Unsupported data source type: {}", typeName));
    }
    source.type = *kind;

    auto priority = get_env_int(p + "_PRIORITY", 100);
    if (!priority) {
        return priority.error();
    }
    source.priority = static_cast<int>(priority.value());
    source.readonly = get_env_bool(p + "_READONLY", false);
    source.enabled = get_env_bool(p + "_ENABLED", true);
    source.tags = get_env_list(p + "_TAGS");

    auto intVar = [&](const std::string& suffix, int64_t fallback) -> Result<int> {
        auto v = get_env_int(p + suffix, fallback);
        if (!v) {
            return v.error();
        }
        return static_cast<int>(v.value());
    };

    switch (source.type) {
        case BackendKind::Filesystem: {
            FilesystemOptions o;
            o.dataDirectory = get_env_or(p + "_DATA_DIRECTORY", "./data");
            auto retention = intVar("_BACKUP_RETENTION_DAYS", 7);
            if (!retention)
                return retention.error();
            o.backupRetentionDays = retention.value();
            o.enableCompression = get_env_bool(p + "_ENABLE_COMPRESSION", false);
            source.options = o;
            break;
        }
        case BackendKind::PostgreSQL: {
            PostgresOptions o;
            o.host = get_env_or(p + "_HOST", "localhost");
            auto port = intVar("_PORT", 5432);
            if (!port)
                return port.error();
            o.port = port.value();
            o.database = get_env_or(p + "_DATABASE", "task_manager");
            o.user = get_env_or(p + "_USER", "postgres");
            o.password = get_env_or(p + "_PASSWORD", "");
            o.ssl = get_env_bool(p + "_SSL", false);
            auto maxConnections = intVar("_MAX_CONNECTIONS", 10);
            if (!maxConnections)
                return maxConnections.error();
            o.maxConnections = maxConnections.value();
            source.options = o;
            break;
        }
        case BackendKind::MongoDB: {
            MongoOptions o;
            o.uri = get_env_or(p + "_URI", "mongodb://localhost:27017");
            o.database = get_env_or(p + "_DATABASE", "task_manager");
            o.collection = get_env_or(p + "_COLLECTION", "tasks");
            auto pool = intVar("_MAX_POOL_SIZE", 10);
            if (!pool)
                return pool.error();
            o.maxPoolSize = pool.value();
            source.options = o;
            break;
        }
        case BackendKind::Memory: {
            MemoryOptions o;
            if (get_env(p + "_MAX_SIZE")) {
                auto maxSize = get_env_int(p + "_MAX_SIZE", 0);
                if (!maxSize)
                    return maxSize.error();
                o.maxSize = maxSize.value();
            }
            o.persistToDisk = get_env_bool(p + "_PERSIST_TO_DISK", false);
            o.persistPath = get_env(p + "_PERSIST_PATH");
            source.options = o;
            break;
        }
    }
    return source;
}

void DataSourceConfigLoader::applyEnvironmentOverrides(MultiSourceConfig& config,
                                                       const std::string& prefix) const {
    for (auto& source : config.sources) {
        const std::string p = prefix + "_" + env_key_for_id(source.id);

        if (auto* pg = std::get_if<PostgresOptions>(&source.options)) {
            if (auto v = get_env(p + "_HOST"))
                pg->host = *v;
            if (get_env(p + "_PORT")) {
                if (auto port = get_env_int(p + "_PORT", pg->port)) {
                    pg->port = static_cast<int>(port.value());
                } else {
                    spdlog::warn("[ConfigLoader] {}", port.error().message);
                }
            }
            if (auto v = get_env(p + "_DATABASE"))
                pg->database = *v;
            if (auto v = get_env(p + "_USER"))
                pg->user = *v;
            if (auto v = get_env(p + "_PASSWORD"))
                pg->password = *v;
            if (auto v = get_env(p + "_SSL"))
                pg->ssl = (*v == "true");
        } else if (auto* mongo = std::get_if<MongoOptions>(&source.options)) {
            if (auto v = get_env(p + "_URI"))
                mongo->uri = *v;
            if (auto v = get_env(p + "_DATABASE"))
                mongo->database = *v;
        }
    }
}

Result<void> DataSourceConfigLoader::save(const MultiSourceConfig& config,
                                          const fs::path& path) const {
    if (auto v = validateMultiSourceConfig(config); !v) {
        return v;
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::WriteError,
                         format("Cannot create directory {}: {}", path.parent_path().string(),
                                ec.message())};
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::WriteError, format("Cannot write {}", path.string())};
    }
    out << toJson(config).dump(2) << '\n';
    if (!out) {
        return Error{ErrorCode::WriteError, format("Failed writing {}", path.string())};
    }

    spdlog::info("[ConfigLoader] Configuration saved to {}", path.string());
    return {};
}

} // namespace taskfed::config
