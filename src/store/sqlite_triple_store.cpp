#include <spdlog/spdlog.h>
#include <factstore/core/uuid.h>
#include <factstore/store/semantic_search.h>
#include <factstore/store/sqlite_triple_store.h>
#include <factstore/store/vector_math.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <limits>
#include <span>
#include <system_error>

namespace factstore::store {

namespace {

constexpr std::array<const char*, 13> kColumns = {
    "assertion_id", "subject",    "predicate",   "object",     "text",
    "scope",        "owner_id",   "observed_at", "valid_from", "valid_until",
    "confidence",   "provenance", "attributes"};

// Column positions in the SELECT list built by selectColumns()
enum ColumnIndex {
    kColSubject = 0,
    kColPredicate,
    kColObject,
    kColScope,
    kColOwnerId,
    kColObservedAt,
    kColValidFrom,
    kColValidUntil,
    kColConfidence,
    kColProvenance,
    kColAttributes,
    kColVector,
};

std::vector<std::string> selectColumns(bool withVector, const std::string& vectorColumn) {
    std::vector<std::string> cols = {"subject",     "predicate",  "object",     "scope",
                                     "owner_id",    "observed_at", "valid_from", "valid_until",
                                     "confidence",  "provenance", "attributes"};
    if (withVector) {
        cols.push_back(vectorColumn);
    }
    return cols;
}

Error storageError(const std::string& context, const Error& cause) {
    return Error{ErrorCode::StorageError, context + ": " + cause.message};
}

std::string encodeProperties(const PropertyMap& map) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, value] : map) {
        j[key] = value;
    }
    // Caller strings need not be valid UTF-8; invalid bytes become U+FFFD
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

PropertyMap decodeProperties(const std::string& text, const char* column) {
    PropertyMap map;
    if (text.empty()) {
        return map;
    }
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::warn("Stored {} is not a JSON object; returning empty map", column);
        return map;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        map.emplace(it.key(), it.value());
    }
    return map;
}

bool isMemoryPath(const std::filesystem::path& path) {
    return path.empty() || path == ":memory:";
}

} // namespace

SqliteTripleStore::SqliteTripleStore(SqliteTripleStoreConfig config,
                                     std::shared_ptr<embedding::ITextEmbedder> embedder,
                                     metadata::Database db)
    : config_(std::move(config)), embedder_(std::move(embedder)), db_(std::move(db)),
      table_(metadata::quoteIdentifier(config_.table_name)),
      vectorColumn_(metadata::quoteIdentifier(config_.vector_column)) {}

SqliteTripleStore::~SqliteTripleStore() {
    close();
}

Result<std::unique_ptr<SqliteTripleStore>>
SqliteTripleStore::open(SqliteTripleStoreConfig config,
                        std::shared_ptr<embedding::ITextEmbedder> embedder) {
    if (config.table_name.empty()) {
        return Error{ErrorCode::InvalidArgument, "table_name must not be empty"};
    }
    if (config.vector_column.empty()) {
        return Error{ErrorCode::InvalidArgument, "vector_column must not be empty"};
    }
    for (const char* column : kColumns) {
        if (config.vector_column == column) {
            return Error{ErrorCode::InvalidArgument,
                         "vector_column '" + config.vector_column +
                             "' collides with a built-in column"};
        }
    }

    const bool inMemory = isMemoryPath(config.path);
    if (inMemory) {
        config.path = ":memory:";
    } else if (config.path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(config.path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::StorageError, "Failed to create directory " +
                                                      config.path.parent_path().string() + ": " +
                                                      ec.message()};
        }
    }

    metadata::Database db;
    auto opened = db.open(config.path.string(), metadata::ConnectionMode::Create);
    if (!opened) {
        return storageError("Failed to open " + config.path.string(), opened.error());
    }
    if (!inMemory) {
        if (auto wal = db.enableWAL(); !wal) {
            spdlog::warn("Could not enable WAL for {}: {}", config.path.string(),
                         wal.error().message);
        }
    }

    std::unique_ptr<SqliteTripleStore> store(
        new SqliteTripleStore(std::move(config), std::move(embedder), std::move(db)));
    auto state = store->loadSchemaState();
    if (!state) {
        return storageError("Failed to read schema of " + store->config_.path.string(),
                            state.error());
    }

    spdlog::debug("SqliteTripleStore opened {} (table: {}, exists: {}, vectors: {}, dim: {})",
                  store->config_.path.string(), store->config_.table_name, store->tableReady_,
                  store->hasVectorColumn_, store->dimension_);
    return store;
}

Result<std::optional<std::string>> SqliteTripleStore::readMeta(const std::string& key) const {
    auto metaExists = db_.tableExists(kMetaTable);
    if (!metaExists)
        return metaExists.error();
    if (!metaExists.value())
        return std::optional<std::string>{};

    auto stmtResult =
        db_.prepare("SELECT value FROM " + metadata::quoteIdentifier(kMetaTable) + " WHERE key = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    auto bound = stmt.bind(1, key);
    if (!bound)
        return bound.error();

    auto row = stmt.step();
    if (!row)
        return row.error();
    if (!row.value())
        return std::optional<std::string>{};
    return std::optional<std::string>{stmt.getString(0)};
}

Result<void> SqliteTripleStore::loadSchemaState() const {
    auto exists = db_.tableExists(config_.table_name);
    if (!exists)
        return exists.error();
    tableReady_ = exists.value();
    if (!tableReady_) {
        hasVectorColumn_ = false;
        dimension_ = 0;
        return {};
    }

    auto hasVector = db_.columnExists(config_.table_name, config_.vector_column);
    if (!hasVector)
        return hasVector.error();
    hasVectorColumn_ = hasVector.value();

    auto dim = readMeta(config_.table_name + ".vector_dim");
    if (!dim)
        return dim.error();
    if (dim.value()) {
        try {
            dimension_ = static_cast<size_t>(std::stoull(*dim.value()));
        } catch (const std::exception&) {
            return Error{ErrorCode::InvalidData,
                         "Invalid vector_dim metadata '" + *dim.value() + "'"};
        }
    }

    auto version = readMeta("schema_version");
    if (!version)
        return version.error();
    if (version.value() && *version.value() != std::to_string(kSchemaVersion)) {
        return Error{ErrorCode::InvalidData,
                     "Unsupported schema_version " + *version.value() + " (expected " +
                         std::to_string(kSchemaVersion) + ")"};
    }
    return {};
}

// Runs inside the add() transaction; member flags are updated by the caller
// only after commit.
Result<void> SqliteTripleStore::ensureSchema(size_t dimension) {
    const std::string meta = metadata::quoteIdentifier(kMetaTable);

    if (!tableReady_) {
        std::string ddl = "CREATE TABLE IF NOT EXISTS " + table_ +
                          " ("
                          "assertion_id TEXT PRIMARY KEY, "
                          "subject TEXT NOT NULL, "
                          "predicate TEXT NOT NULL, "
                          "object TEXT NOT NULL, "
                          "text TEXT NOT NULL, "
                          "scope TEXT NOT NULL, "
                          "owner_id TEXT, "
                          "observed_at TEXT NOT NULL, "
                          "valid_from TEXT, "
                          "valid_until TEXT, "
                          "confidence REAL, "
                          "provenance TEXT NOT NULL DEFAULT '{}', "
                          "attributes TEXT NOT NULL DEFAULT '{}'";
        if (dimension > 0) {
            ddl += ", " + vectorColumn_ + " BLOB";
        }
        ddl += ")";

        auto created = db_.execute(ddl);
        if (!created)
            return created;

        auto partitionIdx = db_.execute(
            "CREATE INDEX IF NOT EXISTS " +
            metadata::quoteIdentifier("idx_" + config_.table_name + "_partition") + " ON " +
            table_ + " (scope, owner_id, observed_at)");
        if (!partitionIdx)
            return partitionIdx;

        auto tripleIdx = db_.execute("CREATE INDEX IF NOT EXISTS " +
                                     metadata::quoteIdentifier("idx_" + config_.table_name +
                                                               "_subject_predicate") +
                                     " ON " + table_ + " (subject, predicate)");
        if (!tripleIdx)
            return tripleIdx;

        auto metaCreated = db_.execute("CREATE TABLE IF NOT EXISTS " + meta +
                                       " (key TEXT PRIMARY KEY, value TEXT NOT NULL)");
        if (!metaCreated)
            return metaCreated;

        auto stmtResult =
            db_.prepare("INSERT OR REPLACE INTO " + meta + " (key, value) VALUES (?, ?)");
        if (!stmtResult)
            return stmtResult.error();
        auto stmt = std::move(stmtResult).value();
        auto bound = stmt.bindAll("schema_version", std::to_string(kSchemaVersion));
        if (!bound)
            return bound;
        auto written = stmt.execute();
        if (!written)
            return written;

        spdlog::info("Created triple table {} in {}{}", config_.table_name,
                     config_.path.string(), dimension > 0 ? " (with vector column)" : "");
    } else if (dimension > 0 && !hasVectorColumn_) {
        auto altered =
            db_.execute("ALTER TABLE " + table_ + " ADD COLUMN " + vectorColumn_ + " BLOB");
        if (!altered)
            return altered;
        spdlog::info("Added vector column {} to {}", config_.vector_column, config_.table_name);
    }

    if (dimension > 0 && dimension_ == 0) {
        auto metaCreated = db_.execute("CREATE TABLE IF NOT EXISTS " + meta +
                                       " (key TEXT PRIMARY KEY, value TEXT NOT NULL)");
        if (!metaCreated)
            return metaCreated;

        auto stmtResult =
            db_.prepare("INSERT OR REPLACE INTO " + meta + " (key, value) VALUES (?, ?)");
        if (!stmtResult)
            return stmtResult.error();
        auto stmt = std::move(stmtResult).value();
        auto bound = stmt.bindAll(config_.table_name + ".vector_dim", std::to_string(dimension));
        if (!bound)
            return bound;
        return stmt.execute();
    }
    return {};
}

Result<void> SqliteTripleStore::insertRows(const std::vector<TripleAssertion>& assertions,
                                           const std::vector<std::string>& ids,
                                           const std::vector<std::vector<float>>& vectors,
                                           bool withVectors) {
    std::vector<std::string> columns(kColumns.begin(), kColumns.end());
    if (withVectors) {
        columns.push_back(vectorColumn_);
    }

    metadata::QueryBuilder qb;
    qb.insertInto(table_).values(columns);

    auto stmtResult = db_.prepare(qb.build());
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    for (size_t i = 0; i < assertions.size(); ++i) {
        const auto& a = assertions[i];
        auto bound = stmt.bindAll(ids[i], a.subject(), a.predicate(), a.object(),
                                  a.canonicalText(), scopeToString(a.scope()), a.ownerId(),
                                  a.observedAt(), a.validFrom(), a.validUntil(), a.confidence(),
                                  encodeProperties(a.provenance()),
                                  encodeProperties(a.attributes()));
        if (!bound)
            return bound;

        if (withVectors) {
            auto blob = vectorToBlob(vectors[i]);
            auto blobBound =
                stmt.bind(static_cast<int>(kColumns.size()) + 1, std::span<const std::byte>(blob));
            if (!blobBound)
                return blobBound;
        }

        auto executed = stmt.execute();
        if (!executed)
            return executed;

        auto reset = stmt.reset();
        if (!reset)
            return reset;
    }
    return {};
}

Result<std::vector<std::string>>
SqliteTripleStore::add(const std::vector<TripleAssertion>& assertions) {
    if (closed_) {
        return Error{ErrorCode::NotInitialized, "Triple store is closed"};
    }
    if (assertions.empty()) {
        return std::vector<std::string>{};
    }

    // Embedding happens before the transaction so no lock is held over network I/O.
    std::vector<std::vector<float>> vectors;
    size_t dim = 0;
    if (embedder_) {
        auto embedded = embedAssertions(*embedder_, assertions);
        if (!embedded)
            return embedded.error();
        vectors = std::move(embedded).value();
        dim = vectors.front().size();
    }

    if (!tableReady_ || (dim > 0 && !hasVectorColumn_)) {
        auto refreshed = loadSchemaState();
        if (!refreshed)
            return storageError("Failed to read schema of " + config_.path.string(),
                                refreshed.error());
    }

    if (dim > 0 && dimension_ != 0 && dim != dimension_) {
        return Error{ErrorCode::InvalidData,
                     "Embedding dimension " + std::to_string(dim) +
                         " does not match stored dimension " + std::to_string(dimension_)};
    }

    std::vector<std::string> ids;
    ids.reserve(assertions.size());
    for (size_t i = 0; i < assertions.size(); ++i) {
        ids.push_back(core::generateUUID());
    }

    auto written = db_.transaction([&]() -> Result<void> {
        auto schema = ensureSchema(dim);
        if (!schema)
            return schema;
        return insertRows(assertions, ids, vectors, dim > 0);
    });
    if (!written) {
        return storageError("Failed to append " + std::to_string(assertions.size()) +
                                " assertions to " + config_.table_name,
                            written.error());
    }

    tableReady_ = true;
    if (dim > 0) {
        hasVectorColumn_ = true;
        dimension_ = dim;
    }

    spdlog::debug("SqliteTripleStore appended {} assertions to {}", assertions.size(),
                  config_.table_name);
    return ids;
}

Result<std::vector<TripleAssertion>> SqliteTripleStore::query(const TripleQuery& query) const {
    if (closed_) {
        return Error{ErrorCode::NotInitialized, "Triple store is closed"};
    }

    auto queryVector = resolveQueryVector(query, embedder_.get());
    if (!queryVector)
        return queryVector.error();

    const bool semantic = queryVector.value().has_value();
    if (!tableReady_ || (semantic && !hasVectorColumn_)) {
        auto refreshed = loadSchemaState();
        if (!refreshed)
            return storageError("Failed to read schema of " + config_.path.string(),
                                refreshed.error());
    }

    if (!tableReady_) {
        return std::vector<TripleAssertion>{};
    }
    if (semantic && !hasVectorColumn_) {
        // No row has ever been embedded into this table
        return std::vector<TripleAssertion>{};
    }

    const auto filters = normalizeFilters(query);
    const size_t limit = effectiveLimit(query.limit);

    metadata::QueryBuilder qb;
    qb.select(selectColumns(semantic, vectorColumn_)).from(table_);

    std::vector<std::string> params;
    if (filters.subject) {
        qb.andWhere("subject = ?");
        params.push_back(*filters.subject);
    }
    if (filters.predicate) {
        qb.andWhere("predicate = ?");
        params.push_back(*filters.predicate);
    }
    if (filters.object) {
        qb.andWhere("object = ?");
        params.push_back(*filters.object);
    }
    if (filters.scope) {
        qb.andWhere("scope = ?");
        params.push_back(scopeToString(*filters.scope));
    }
    if (filters.owner_id) {
        qb.andWhere("owner_id = ?");
        params.push_back(*filters.owner_id);
    }
    if (filters.since) {
        qb.andWhere("observed_at >= ?");
        params.push_back(*filters.since);
    }
    if (filters.until) {
        qb.andWhere("observed_at <= ?");
        params.push_back(*filters.until);
    }
    if (filters.active_at) {
        qb.andWhere("(valid_from IS NULL OR valid_from <= ?)");
        params.push_back(*filters.active_at);
        qb.andWhere("(valid_until IS NULL OR valid_until > ?)");
        params.push_back(*filters.active_at);
    }

    if (semantic) {
        // Rank every filtered candidate; limit applies after ranking
        qb.andWhere(vectorColumn_ + " IS NOT NULL");
        qb.orderBy("rowid");
    } else {
        qb.orderBy("observed_at", query.order == SortOrder::Ascending).thenBy("rowid");
        if (limit > 0) {
            qb.limit(static_cast<int>(std::min<size_t>(limit, std::numeric_limits<int>::max())));
        }
    }

    const std::string sql = qb.build();
    auto stmtResult = db_.prepare(sql);
    if (!stmtResult) {
        return storageError("Failed to prepare query", stmtResult.error());
    }
    auto stmt = std::move(stmtResult).value();
    for (size_t i = 0; i < params.size(); ++i) {
        auto bound = stmt.bind(static_cast<int>(i) + 1, params[i]);
        if (!bound)
            return storageError("Failed to bind query parameter", bound.error());
    }

    std::vector<TripleAssertion> rows;
    std::vector<std::vector<float>> vectors;
    while (true) {
        auto step = stmt.step();
        if (!step) {
            return storageError("Failed to read " + config_.table_name, step.error());
        }
        if (!step.value())
            break;

        TripleAssertionFields fields;
        fields.subject = stmt.getString(kColSubject);
        fields.predicate = stmt.getString(kColPredicate);
        fields.object = stmt.getString(kColObject);

        const auto scopeText = stmt.getString(kColScope);
        auto scope = parseScope(scopeText);
        if (!scope) {
            return Error{ErrorCode::InvalidData, "Stored row has unknown scope '" + scopeText + "'"};
        }
        fields.scope = *scope;
        fields.owner_id = stmt.getOptionalString(kColOwnerId);
        fields.observed_at = stmt.getString(kColObservedAt);
        fields.valid_from = stmt.getOptionalString(kColValidFrom);
        fields.valid_until = stmt.getOptionalString(kColValidUntil);
        if (!stmt.isNull(kColConfidence)) {
            fields.confidence = stmt.getDouble(kColConfidence);
        }
        fields.provenance = decodeProperties(stmt.getString(kColProvenance), "provenance");
        fields.attributes = decodeProperties(stmt.getString(kColAttributes), "attributes");

        auto assertion = TripleAssertion::create(std::move(fields));
        if (!assertion) {
            return Error{ErrorCode::InvalidData,
                         "Stored row failed validation: " + assertion.error().message};
        }
        rows.push_back(std::move(assertion).value());

        if (semantic) {
            vectors.push_back(blobToVector(stmt.getBlob(kColVector)));
        }
    }

    if (!semantic) {
        spdlog::debug("SqliteTripleStore query returned {} rows", rows.size());
        return rows;
    }

    std::vector<RankCandidate> candidates;
    candidates.reserve(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        candidates.push_back({&rows[i], &vectors[i]});
    }

    auto ranked = rankBySimilarity(candidates, *queryVector.value(), query.min_score, limit);
    if (!ranked)
        return ranked.error();

    std::vector<TripleAssertion> out;
    out.reserve(ranked.value().size());
    for (const auto& hit : ranked.value()) {
        out.push_back(*hit.assertion);
    }
    return out;
}

Result<size_t> SqliteTripleStore::count() const {
    if (closed_) {
        return Error{ErrorCode::NotInitialized, "Triple store is closed"};
    }
    if (!tableReady_) {
        auto refreshed = loadSchemaState();
        if (!refreshed)
            return storageError("Failed to read schema of " + config_.path.string(),
                                refreshed.error());
        if (!tableReady_)
            return size_t{0};
    }

    auto stmtResult = db_.prepare("SELECT COUNT(*) FROM " + table_);
    if (!stmtResult)
        return storageError("Failed to count rows", stmtResult.error());
    auto stmt = std::move(stmtResult).value();
    auto step = stmt.step();
    if (!step)
        return storageError("Failed to count rows", step.error());
    return static_cast<size_t>(stmt.getInt64(0));
}

void SqliteTripleStore::close() {
    if (closed_) {
        return;
    }
    db_.close();
    closed_ = true;
    spdlog::debug("SqliteTripleStore closed ({})", config_.path.string());
}

} // namespace factstore::store
