#include <gtest/gtest.h>
#include <factstore/store/store_factory.h>

#include "../../common/test_embedders.h"
#include "../../common/test_helpers.h"

#include <cstdlib>

using namespace factstore;
using namespace factstore::store;

class StoreFactoryTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = factstore::tests::make_temp_dir("factstore_factory_"); }

    void TearDown() override {
        ::unsetenv("FACTSTORE_TEST_KEY");
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

TEST_F(StoreFactoryTest, ParseBackend) {
    EXPECT_EQ(parseBackend("memory"), TripleStoreBackend::InMemory);
    EXPECT_EQ(parseBackend(" SQLite "), TripleStoreBackend::Sqlite);
    EXPECT_EQ(parseBackend("in_memory"), TripleStoreBackend::InMemory);
    EXPECT_FALSE(parseBackend("postgres").has_value());
    EXPECT_STREQ(backendToString(TripleStoreBackend::Sqlite), "sqlite");
}

TEST_F(StoreFactoryTest, MissingConfigFileUsesDefaults) {
    auto cfg = loadStoreConfig(dir_ / "absent.toml");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg.value().backend, TripleStoreBackend::InMemory);
    EXPECT_EQ(cfg.value().sqlite.table_name, "triple_assertions");
    EXPECT_EQ(cfg.value().sqlite.vector_column, "vector");
    EXPECT_EQ(cfg.value().sqlite.path.filename().string(), "triples.db");

    auto embedder = loadEmbedderConfig(dir_ / "absent.toml");
    ASSERT_TRUE(embedder.has_value());
    EXPECT_FALSE(embedder.value().has_value());
}

TEST_F(StoreFactoryTest, ReadsStoreSection) {
    auto path = factstore::tests::write_file(dir_ / "config.toml", R"(
# factstore settings
[store]
backend = "sqlite"
path = ")" + (dir_ / "data" / "facts.db").string() + R"("  # inline comment
table = "facts"
vector_column = 'embedding'
)");

    auto cfg = loadStoreConfig(path);
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg.value().backend, TripleStoreBackend::Sqlite);
    EXPECT_EQ(cfg.value().sqlite.path.string(), (dir_ / "data" / "facts.db").string());
    EXPECT_EQ(cfg.value().sqlite.table_name, "facts");
    EXPECT_EQ(cfg.value().sqlite.vector_column, "embedding");

    auto store = createTripleStore(cfg.value());
    ASSERT_TRUE(store.has_value()) << store.error().message;
    EXPECT_FALSE(store.value()->hasEmbedder());
    EXPECT_TRUE(std::filesystem::exists(dir_ / "data"));
}

TEST_F(StoreFactoryTest, UnknownBackendIsRejected) {
    auto path = factstore::tests::write_file(dir_ / "config.toml", "[store]\nbackend = \"cloud\"\n");
    auto cfg = loadStoreConfig(path);
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().code, ErrorCode::InvalidArgument);
}

TEST_F(StoreFactoryTest, ReadsEmbeddingsSection) {
    ::setenv("FACTSTORE_TEST_KEY", "sk-test", 1);
    auto path = factstore::tests::write_file(dir_ / "config.toml", R"([embeddings]
url = "http://gateway:4000/v1/embeddings"
model = "text-embedding-3-small"
api_key_env = "FACTSTORE_TEST_KEY"
timeout_ms = 2500
)");

    auto cfg = loadEmbedderConfig(path);
    ASSERT_TRUE(cfg.has_value());
    ASSERT_TRUE(cfg.value().has_value());
    const auto& e = *cfg.value();
    EXPECT_EQ(e.url, "http://gateway:4000/v1/embeddings");
    EXPECT_EQ(e.model, "text-embedding-3-small");
    ASSERT_TRUE(e.api_key.has_value());
    EXPECT_EQ(*e.api_key, "sk-test");
    EXPECT_EQ(e.timeout, std::chrono::milliseconds(2500));
    EXPECT_FALSE(e.insecure_tls);
}

TEST_F(StoreFactoryTest, InvalidTimeoutIsRejected) {
    auto path = factstore::tests::write_file(
        dir_ / "config.toml", "[embeddings]\nurl = \"http://x\"\ntimeout_ms = soon\n");
    auto cfg = loadEmbedderConfig(path);
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().code, ErrorCode::InvalidArgument);
}

TEST_F(StoreFactoryTest, CreatesInMemoryWithEmbedder) {
    StoreConfig cfg;
    auto store = createTripleStore(cfg, std::make_shared<factstore::tests::HashEmbedder>(4));
    ASSERT_TRUE(store.has_value());
    EXPECT_TRUE(store.value()->hasEmbedder());
}
