#include <gtest/gtest.h>

#include <taskfed/config/data_source_loader.h>

#include "common/test_helpers.h"

using namespace taskfed;
using namespace taskfed::config;
using taskfed::tests::ScopedEnv;

class DataSourceLoaderTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = taskfed::tests::make_temp_dir("taskfed_loader_"); }
    void TearDown() override { std::filesystem::remove_all(dir_); }

    LoaderOptions isolatedOptions() const {
        LoaderOptions options;
        options.envPrefix = "TFTEST";
        options.searchPaths = std::vector<std::filesystem::path>{dir_ / "missing.json"};
        return options;
    }

    std::filesystem::path dir_;
};

TEST_F(DataSourceLoaderTest, FallsBackToDefaultConfiguration) {
    ScopedEnv count("TFTEST_COUNT", std::nullopt);
    auto config = DataSourceConfigLoader{}.load(isolatedOptions());
    ASSERT_TRUE(config) << config.error().message;
    ASSERT_EQ(config.value().sources.size(), 1u);
    EXPECT_EQ(config.value().sources[0].id, "default-file");
}

TEST_F(DataSourceLoaderTest, ExplicitFileWins) {
    auto path = taskfed::tests::write_file(dir_ / "sources.json", R"({
        "sources": [{"id": "mem", "name": "Memory", "type": "memory", "priority": 3}],
        "conflictResolution": "priority"
    })");
    auto options = isolatedOptions();
    options.configPath = path;

    auto config = DataSourceConfigLoader{}.load(options);
    ASSERT_TRUE(config) << config.error().message;
    EXPECT_EQ(config.value().sources[0].id, "mem");
    EXPECT_EQ(config.value().conflictResolution, ConflictResolutionStrategy::Priority);
}

TEST_F(DataSourceLoaderTest, SearchPathsAreTriedInOrder) {
    taskfed::tests::write_file(dir_ / "second.json", R"({
        "sources": [{"id": "second", "name": "Second", "type": "memory"}]})");
    auto options = isolatedOptions();
    options.searchPaths =
        std::vector<std::filesystem::path>{dir_ / "first.json", dir_ / "second.json"};

    auto config = DataSourceConfigLoader{}.load(options);
    ASSERT_TRUE(config);
    EXPECT_EQ(config.value().sources[0].id, "second");
}

TEST_F(DataSourceLoaderTest, MissingRequiredFileIsAnError) {
    auto options = isolatedOptions();
    options.configPath = dir_ / "nope.json";
    options.requireConfigFile = true;
    auto config = DataSourceConfigLoader{}.load(options);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, ErrorCode::FileNotFound);
}

TEST_F(DataSourceLoaderTest, RejectsYamlAndBrokenJson) {
    DataSourceConfigLoader loader;
    auto yaml = taskfed::tests::write_file(dir_ / "sources.yaml", "sources: []\n");
    auto r = loader.loadFromFile(yaml);
    ASSERT_FALSE(r);
    EXPECT_NE(r.error().message.find("YAML"), std::string::npos);

    auto broken = taskfed::tests::write_file(dir_ / "broken.json", "{ not json");
    auto b = loader.loadFromFile(broken);
    ASSERT_FALSE(b);
    EXPECT_EQ(b.error().code, ErrorCode::ConfigurationError);
}

TEST_F(DataSourceLoaderTest, InvalidFileFailsValidation) {
    auto path = taskfed::tests::write_file(dir_ / "sources.json", R"({
        "sources": [{"id": "a", "name": "A", "type": "filesystem", "config": {}}]})");
    auto options = isolatedOptions();
    options.configPath = path;
    auto config = DataSourceConfigLoader{}.load(options);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, ErrorCode::ConfigurationError);
}

TEST_F(DataSourceLoaderTest, LoadsSourcesFromEnvironment) {
    ScopedEnv count("TFTEST_COUNT", std::string("2"));
    ScopedEnv id0("TFTEST_0_ID", std::string("files"));
    ScopedEnv dir0("TFTEST_0_DATA_DIRECTORY", (dir_ / "data").string());
    ScopedEnv tags0("TFTEST_0_TAGS", std::string("web,api"));
    ScopedEnv id1("TFTEST_1_ID", std::string("cache"));
    ScopedEnv type1("TFTEST_1_TYPE", std::string("memory"));
    ScopedEnv prio1("TFTEST_1_PRIORITY", std::string("20"));
    ScopedEnv ro1("TFTEST_1_READONLY", std::string("true"));
    ScopedEnv strategy("TFTEST_CONFLICT_RESOLUTION", std::string("priority"));

    auto config = DataSourceConfigLoader{}.load(isolatedOptions());
    ASSERT_TRUE(config) << config.error().message;
    const auto& sources = config.value().sources;
    ASSERT_EQ(sources.size(), 2u);
    EXPECT_EQ(sources[0].id, "files");
    EXPECT_EQ(sources[0].priority, 100);
    EXPECT_EQ(sources[0].tags, (std::vector<std::string>{"web", "api"}));
    EXPECT_EQ(sources[1].type, BackendKind::Memory);
    EXPECT_EQ(sources[1].priority, 20);
    EXPECT_TRUE(sources[1].readonly);
    EXPECT_EQ(config.value().conflictResolution, ConflictResolutionStrategy::Priority);
}

TEST_F(DataSourceLoaderTest, BadEnvironmentNumbersAreErrors) {
    ScopedEnv count("TFTEST_COUNT", std::string("zero"));
    auto config = DataSourceConfigLoader{}.load(isolatedOptions());
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, ErrorCode::ConfigurationError);
}

TEST_F(DataSourceLoaderTest, CredentialOverridesApplyById) {
    auto path = taskfed::tests::write_file(dir_ / "sources.json", R"({
        "sources": [{"id": "prod-db", "name": "Prod", "type": "postgresql",
                     "config": {"host": "localhost", "database": "tasks", "user": "app"}}]})");
    ScopedEnv host("TFTEST_PROD_DB_HOST", std::string("db.internal"));
    ScopedEnv port("TFTEST_PROD_DB_PORT", std::string("6543"));
    ScopedEnv password("TFTEST_PROD_DB_PASSWORD", std::string("s3cret"));

    auto options = isolatedOptions();
    options.configPath = path;
    auto config = DataSourceConfigLoader{}.load(options);
    ASSERT_TRUE(config) << config.error().message;
    const auto& pg = std::get<PostgresOptions>(config.value().sources[0].options);
    EXPECT_EQ(pg.host, "db.internal");
    EXPECT_EQ(pg.port, 6543);
    EXPECT_EQ(pg.password, "s3cret");
    EXPECT_EQ(pg.user, "app");
}

TEST_F(DataSourceLoaderTest, SaveWritesLoadableJson) {
    DataSourceConfigLoader loader;
    auto path = dir_ / "nested" / "data-sources.json";
    ASSERT_TRUE(loader.save(defaultMultiSourceConfig(), path));

    auto loaded = loader.loadFromFile(path);
    ASSERT_TRUE(loaded);
    ASSERT_TRUE(loaded.value().has_value());
    EXPECT_EQ(loaded.value()->sources[0].id, "default-file");

    MultiSourceConfig invalid;
    EXPECT_FALSE(loader.save(invalid, dir_ / "invalid.json"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "invalid.json"));
}
