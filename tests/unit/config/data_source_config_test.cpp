#include <gtest/gtest.h>

#include <taskfed/config/data_source_config.h>

using namespace taskfed;
using namespace taskfed::config;
using nlohmann::json;

namespace {

SourceConfig fileSource(const std::string& id, int priority = 10) {
    SourceConfig s;
    s.id = id;
    s.name = "Source " + id;
    s.type = BackendKind::Filesystem;
    s.priority = priority;
    s.options = FilesystemOptions{"./data-" + id, 7, false};
    return s;
}

} // namespace

TEST(DataSourceConfigTest, DefaultConfigurationIsValid) {
    auto config = defaultMultiSourceConfig();
    ASSERT_EQ(config.sources.size(), 1u);
    const auto& source = config.sources.front();
    EXPECT_EQ(source.id, "default-file");
    EXPECT_EQ(source.name, "Default File Storage");
    EXPECT_EQ(source.priority, 100);
    EXPECT_EQ(std::get<FilesystemOptions>(source.options).dataDirectory, "./data");
    EXPECT_EQ(config.conflictResolution, ConflictResolutionStrategy::Latest);
    EXPECT_TRUE(validateMultiSourceConfig(config));
}

TEST(DataSourceConfigTest, ParsesFullDocument) {
    auto doc = json::parse(R"({
        "sources": [
            {"id": "primary", "name": "Primary", "type": "filesystem", "priority": 100,
             "tags": ["web", "api"], "config": {"dataDirectory": "/tmp/p", "backupRetentionDays": 3}},
            {"id": "cache", "name": "Cache", "type": "memory", "priority": 50, "readonly": true,
             "config": {"maxSize": 100}},
            {"id": "pg", "name": "Postgres", "type": "postgresql", "priority": 10, "enabled": false,
             "config": {"host": "db", "database": "tasks", "user": "app"}}
        ],
        "conflictResolution": "priority",
        "aggregationEnabled": true,
        "operationTimeout": 5000,
        "maxRetries": 1,
        "router": {"healthCheckInterval": 1000, "maxFailures": 5, "enableFallback": false,
                   "recoveryCheckDelay": 250, "parallelQueries": false}
    })");

    auto parsed = parseMultiSourceConfig(doc);
    ASSERT_TRUE(parsed) << parsed.error().message;
    const auto& config = parsed.value();

    ASSERT_EQ(config.sources.size(), 3u);
    EXPECT_TRUE(config.sources[0].hasTag("api"));
    EXPECT_FALSE(config.sources[0].hasTag("ops"));
    EXPECT_EQ(std::get<FilesystemOptions>(config.sources[0].options).backupRetentionDays,
              std::optional<int>(3));
    EXPECT_TRUE(config.sources[1].readonly);
    EXPECT_EQ(std::get<MemoryOptions>(config.sources[1].options).maxSize,
              std::optional<int64_t>(100));
    EXPECT_FALSE(config.sources[2].enabled);
    EXPECT_EQ(std::get<PostgresOptions>(config.sources[2].options).port, 5432);

    EXPECT_EQ(config.conflictResolution, ConflictResolutionStrategy::Priority);
    EXPECT_TRUE(config.aggregationEnabled);
    EXPECT_EQ(config.operationTimeout, Duration(5000));

    auto router = config.routerConfig();
    EXPECT_EQ(router.healthCheckInterval, Duration(1000));
    EXPECT_EQ(router.maxFailures, 5);
    EXPECT_FALSE(router.enableFallback);
    EXPECT_EQ(router.recoveryCheckDelay, Duration(250));
    EXPECT_EQ(router.operationTimeout, Duration(5000));

    auto aggregator = config.aggregatorConfig();
    EXPECT_EQ(aggregator.conflictResolution, ConflictResolutionStrategy::Priority);
    EXPECT_EQ(aggregator.queryTimeout, Duration(5000));
    EXPECT_FALSE(aggregator.parallelQueries);

    EXPECT_TRUE(validateMultiSourceConfig(config));
}

TEST(DataSourceConfigTest, MissingFieldsTakeDefaults) {
    auto parsed = parseMultiSourceConfig(json::parse(
        R"({"sources": [{"id": "a", "name": "A", "config": {"dataDirectory": "./a"}}]})"));
    ASSERT_TRUE(parsed);
    const auto& config = parsed.value();
    EXPECT_EQ(config.sources[0].type, BackendKind::Filesystem);
    EXPECT_TRUE(config.sources[0].enabled);
    EXPECT_FALSE(config.sources[0].readonly);
    EXPECT_EQ(config.conflictResolution, ConflictResolutionStrategy::Latest);
    EXPECT_EQ(config.operationTimeout, Duration(30000));
    EXPECT_EQ(config.healthCheckInterval, Duration(60000));
    EXPECT_EQ(config.maxFailures, 3);
    EXPECT_TRUE(config.enableFallback);
    EXPECT_EQ(config.recoveryCheckDelay, Duration(5000));
    EXPECT_TRUE(config.parallelQueries);
}

TEST(DataSourceConfigTest, RejectsUnknownNames) {
    auto badType = parseMultiSourceConfig(
        json::parse(R"({"sources": [{"id": "a", "name": "A", "type": "redis"}]})"));
    ASSERT_FALSE(badType);
    EXPECT_EQ(badType.error().code, ErrorCode::ConfigurationError);

    auto badStrategy = parseMultiSourceConfig(json::parse(R"({"conflictResolution": "newest"})"));
    ASSERT_FALSE(badStrategy);
    EXPECT_EQ(badStrategy.error().code, ErrorCode::ConfigurationError);

    auto badShape = parseMultiSourceConfig(json::parse(R"({"sources": {"id": "a"}})"));
    EXPECT_FALSE(badShape);

    auto badValue = parseMultiSourceConfig(json::parse(R"({"maxRetries": "three"})"));
    EXPECT_FALSE(badValue);
}

TEST(DataSourceConfigTest, ValidationRules) {
    MultiSourceConfig config;
    EXPECT_FALSE(validateMultiSourceConfig(config)); // no sources

    config.sources = {fileSource("a"), fileSource("a")};
    auto dup = validateMultiSourceConfig(config);
    ASSERT_FALSE(dup);
    EXPECT_NE(dup.error().message.find("duplicate"), std::string::npos);

    config.sources = {fileSource("a")};
    config.sources[0].priority = -1;
    EXPECT_FALSE(validateMultiSourceConfig(config));

    config.sources = {fileSource("a")};
    config.sources[0].name.clear();
    EXPECT_FALSE(validateMultiSourceConfig(config));

    config.sources = {fileSource("a")};
    std::get<FilesystemOptions>(config.sources[0].options).dataDirectory.clear();
    EXPECT_FALSE(validateMultiSourceConfig(config));

    config.sources = {fileSource("a")};
    config.operationTimeout = Duration(0);
    EXPECT_FALSE(validateMultiSourceConfig(config));

    config.operationTimeout = Duration(100);
    config.maxRetries = -1;
    EXPECT_FALSE(validateMultiSourceConfig(config));

    config.maxRetries = 0;
    EXPECT_TRUE(validateMultiSourceConfig(config));
}

TEST(DataSourceConfigTest, ValidatesBackendSpecificOptions) {
    SourceConfig pg;
    pg.id = "pg";
    pg.name = "Postgres";
    pg.type = BackendKind::PostgreSQL;
    PostgresOptions pgo;
    pgo.host = "db";
    pgo.database = "tasks";
    pgo.user = "app";
    pg.options = pgo;
    EXPECT_TRUE(validateSourceConfig(pg));

    std::get<PostgresOptions>(pg.options).port = 70000;
    EXPECT_FALSE(validateSourceConfig(pg));

    SourceConfig mongo;
    mongo.id = "mongo";
    mongo.name = "Mongo";
    mongo.type = BackendKind::MongoDB;
    mongo.options = MongoOptions{};
    EXPECT_FALSE(validateSourceConfig(mongo));

    SourceConfig mismatch = fileSource("x");
    mismatch.type = BackendKind::Memory;
    EXPECT_FALSE(validateSourceConfig(mismatch));
}

TEST(DataSourceConfigTest, StrategyParsing) {
    EXPECT_EQ(tryParseConflictResolutionStrategy("merge"), ConflictResolutionStrategy::Merge);
    EXPECT_FALSE(tryParseConflictResolutionStrategy("LATEST"));
    EXPECT_EQ(parseConflictResolutionStrategy("whatever"), ConflictResolutionStrategy::Priority);
    EXPECT_STREQ(toString(ConflictResolutionStrategy::Manual), "manual");
}

TEST(DataSourceConfigTest, JsonOutputParsesBack) {
    MultiSourceConfig config;
    config.sources = {fileSource("a", 5)};
    config.sources[0].tags = {"web"};
    config.conflictResolution = ConflictResolutionStrategy::Merge;
    config.maxFailures = 7;

    auto parsed = parseMultiSourceConfig(toJson(config));
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value().sources[0].priority, 5);
    EXPECT_EQ(parsed.value().sources[0].tags, std::vector<std::string>{"web"});
    EXPECT_EQ(parsed.value().conflictResolution, ConflictResolutionStrategy::Merge);
    EXPECT_EQ(parsed.value().maxFailures, 7);
}
