#pragma once

#include <factstore/embedding/text_embedder.h>
#include <factstore/metadata/database.h>
#include <factstore/store/triple_store.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace factstore::store {

/**
 * Location and naming of the persistent assertion table.
 */
struct SqliteTripleStoreConfig {
    std::filesystem::path path;                  // Database file (":memory:" allowed)
    std::string table_name = "triple_assertions";
    std::string vector_column = "vector";
};

/**
 * Disk-backed triple store on a single SQLite table.
 *
 * The table is created lazily by the first add(). Vectors are stored as raw
 * float32 blobs and ranked in process, so structured and semantic results
 * match InMemoryTripleStore for the same data.
 *
 * One instance owns one connection. Not thread-safe; callers must serialize
 * access externally.
 */
class SqliteTripleStore final : public ITripleStore {
public:
    static constexpr int kSchemaVersion = 1;
    static constexpr const char* kMetaTable = "factstore_meta";

    /**
     * Open or create the database at @p config.path, creating missing parent
     * directories. Fails with ErrorCode::StorageError when the file cannot be
     * opened, and ErrorCode::InvalidArgument for empty table/column names.
     */
    static Result<std::unique_ptr<SqliteTripleStore>>
    open(SqliteTripleStoreConfig config,
         std::shared_ptr<embedding::ITextEmbedder> embedder = nullptr);

    ~SqliteTripleStore() override;

    SqliteTripleStore(const SqliteTripleStore&) = delete;
    SqliteTripleStore& operator=(const SqliteTripleStore&) = delete;

    Result<std::vector<std::string>> add(const std::vector<TripleAssertion>& assertions) override;
    Result<std::vector<TripleAssertion>> query(const TripleQuery& query) const override;
    Result<size_t> count() const override;
    bool hasEmbedder() const override { return embedder_ != nullptr; }
    void close() override;

    const SqliteTripleStoreConfig& config() const { return config_; }

    // Schema state, mostly for diagnostics and tests
    bool tableExists() const { return tableReady_; }
    bool hasVectorColumn() const { return hasVectorColumn_; }
    size_t vectorDimension() const { return dimension_; }

private:
    SqliteTripleStore(SqliteTripleStoreConfig config,
                      std::shared_ptr<embedding::ITextEmbedder> embedder,
                      metadata::Database db);

    // Re-reads table, vector column and dimension; safe to call repeatedly
    Result<void> loadSchemaState() const;
    Result<void> ensureSchema(size_t dimension);
    Result<void> insertRows(const std::vector<TripleAssertion>& assertions,
                            const std::vector<std::string>& ids,
                            const std::vector<std::vector<float>>& vectors,
                            bool withVectors);
    Result<std::optional<std::string>> readMeta(const std::string& key) const;

    SqliteTripleStoreConfig config_;
    std::shared_ptr<embedding::ITextEmbedder> embedder_;
    mutable metadata::Database db_;
    std::string table_;        // quoted
    std::string vectorColumn_; // quoted
    // Cached schema view; another connection may create or extend the table
    mutable bool tableReady_ = false;
    mutable bool hasVectorColumn_ = false;
    mutable size_t dimension_ = 0;
    bool closed_ = false;
};

} // namespace factstore::store
