#include <gtest/gtest.h>

#include <taskfed/config/data_source_config.h>
#include <taskfed/storage/storage_backend.h>

#include "common/scripted_backend.h"
#include "common/test_helpers.h"

using namespace taskfed;
using namespace taskfed::storage;

namespace {

config::SourceConfig sourceOf(config::BackendKind kind) {
    config::SourceConfig source;
    source.id = "s";
    source.name = "S";
    source.type = kind;
    switch (kind) {
        case config::BackendKind::Filesystem:
            source.options = config::FilesystemOptions{"/tmp/taskfed-factory", 7, false};
            break;
        case config::BackendKind::Memory:
            source.options = config::MemoryOptions{};
            break;
        case config::BackendKind::PostgreSQL:
            source.options = config::PostgresOptions{};
            break;
        case config::BackendKind::MongoDB:
            source.options = config::MongoOptions{};
            break;
    }
    return source;
}

} // namespace

TEST(StorageBackendFactoryTest, CreatesBuiltInBackends) {
    auto fsBackend = StorageBackendFactory::create(sourceOf(config::BackendKind::Filesystem));
    ASSERT_TRUE(fsBackend) << fsBackend.error().message;
    EXPECT_EQ(fsBackend.value()->getType(), "filesystem");

    auto memBackend = StorageBackendFactory::create(sourceOf(config::BackendKind::Memory));
    ASSERT_TRUE(memBackend);
    EXPECT_EQ(memBackend.value()->getType(), "memory");
}

TEST(StorageBackendFactoryTest, DatabaseKindsAreNotSupported) {
    for (auto kind : {config::BackendKind::PostgreSQL, config::BackendKind::MongoDB}) {
        auto r = StorageBackendFactory::create(sourceOf(kind));
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().code, ErrorCode::NotSupported);
    }
}

TEST(StorageBackendFactoryTest, FilesystemRequiresDirectory) {
    auto source = sourceOf(config::BackendKind::Filesystem);
    std::get<config::FilesystemOptions>(source.options).dataDirectory.clear();
    auto r = StorageBackendFactory::create(source);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ConfigurationError);
}

TEST(StorageBackendFactoryTest, RegisteredCreatorTakesPrecedence) {
    StorageBackendFactory::registerBackendType<taskfed::tests::ScriptedBackend>("postgresql");
    auto r = StorageBackendFactory::create(sourceOf(config::BackendKind::PostgreSQL));
    StorageBackendFactory::unregisterBackend("postgresql");

    ASSERT_TRUE(r);
    EXPECT_EQ(r.value()->getType(), "scripted");

    auto after = StorageBackendFactory::create(sourceOf(config::BackendKind::PostgreSQL));
    EXPECT_FALSE(after);
}
