#include <spdlog/spdlog.h>
#include <factstore/metadata/database.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace factstore::metadata {

namespace {

constexpr int kMaxRetries = 5;
constexpr auto kInitialBackoff = std::chrono::milliseconds(10);
constexpr int kBusyTimeoutMs = 5000;

Error bindError(const char* what, int rc) {
    return Error{ErrorCode::DatabaseError,
                 std::string("Failed to bind ") + what + ": " + sqlite3_errstr(rc)};
}

// Joins items with a separator
template<typename Fn>
void appendJoined(std::ostream& out, size_t count, const char* sep, Fn&& item) {
    for (size_t i = 0; i < count; ++i) {
        if (i > 0)
            out << sep;
        item(i);
    }
}

} // namespace

// Statement implementation
Statement::Statement(sqlite3* db, const std::string& sql) {
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK)
        return bindError("null", rc);
    return {};
}

Result<void> Statement::bind(int index, double value) {
    int rc = sqlite3_bind_double(stmt_, index, value);
    if (rc != SQLITE_OK)
        return bindError("double", rc);
    return {};
}

Result<void> Statement::bind(int index, std::string_view value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK)
        return bindError("text", rc);
    return {};
}

Result<void> Statement::bind(int index, std::span<const std::byte> blob) {
    int rc = sqlite3_bind_blob(stmt_, index, blob.data(), static_cast<int>(blob.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK)
        return bindError("blob", rc);
    return {};
}

int Statement::stepWithRetry() {
    auto backoff = kInitialBackoff;
    int rc = SQLITE_OK;
    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        rc = sqlite3_step(stmt_);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED)
            return rc;
        if (attempt + 1 < kMaxRetries) {
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }
    return rc;
}

Result<void> Statement::execute() {
    int rc = stepWithRetry();
    if (rc == SQLITE_DONE) {
        return {};
    }

    std::string errMsg = "Failed to execute statement: " + std::string(sqlite3_errstr(rc));
    if (rc == SQLITE_CONSTRAINT) {
        if (const char* sql = sqlite3_sql(stmt_)) {
            const size_t len = std::strlen(sql);
            errMsg += " [SQL: " + std::string(sql, std::min(len, size_t{100})) +
                      (len > 100 ? "..." : "") + "]";
        }
    }
    return Error{ErrorCode::DatabaseError, errMsg};
}

Result<bool> Statement::step() {
    int rc = stepWithRetry();
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;
    return Error{ErrorCode::DatabaseError,
                 "Failed to step statement: " + std::string(sqlite3_errstr(rc))};
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::getDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::getString(int column) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    if (!text)
        return "";
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::optional<std::string> Statement::getOptionalString(int column) const {
    if (isNull(column))
        return std::nullopt;
    return getString(column);
}

std::vector<std::byte> Statement::getBlob(int column) const {
    const void* blob = sqlite3_column_blob(stmt_, column);
    int size = sqlite3_column_bytes(stmt_, column);
    if (!blob || size <= 0)
        return {};

    std::vector<std::byte> result(static_cast<size_t>(size));
    std::memcpy(result.data(), blob, result.size());
    return result;
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Result<void> Statement::reset() {
    if (!stmt_) {
        return Error{ErrorCode::DatabaseError, "Statement is null"};
    }
    int rc = sqlite3_reset(stmt_);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError,
                     "Failed to reset statement: " + std::string(sqlite3_errstr(rc))};
    }
    return {};
}

// Database implementation
Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), inTransaction_(other.inTransaction_) {
    other.db_ = nullptr;
    other.inTransaction_ = false;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        inTransaction_ = other.inTransaction_;
        other.db_ = nullptr;
        other.inTransaction_ = false;
    }
    return *this;
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    if (db_) {
        return Error{ErrorCode::InvalidArgument, "Database already open: " + path_};
    }

    int flags = SQLITE_OPEN_READWRITE;
    if (mode == ConnectionMode::Create) {
        flags |= SQLITE_OPEN_CREATE;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return Error{ErrorCode::DatabaseError, "Failed to open database " + path + ": " + error};
    }

    // Wait for locks held by other connections instead of failing at once
    sqlite3_busy_timeout(db_, kBusyTimeoutMs);

    path_ = path;
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    path_.clear();
    inTransaction_ = false;
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::NotInitialized, "Database not open"};
    }

    try {
        return Statement(db_, sql);
    } catch (const std::runtime_error& e) {
        return Error{ErrorCode::DatabaseError, e.what()};
    }
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::NotInitialized, "Database not open"};
    }

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : sqlite3_errstr(rc);
        sqlite3_free(errMsg);
        spdlog::debug("SQL exec failed ({}): {}", error, sql);
        return Error{ErrorCode::DatabaseError, "Failed to execute SQL: " + error};
    }
    return {};
}

Result<void> Database::beginTransaction() {
    if (inTransaction_) {
        return Error{ErrorCode::DatabaseError, "Already in transaction"};
    }

    // IMMEDIATE takes the write lock up front so appends never upgrade mid-batch
    auto result = execute("BEGIN IMMEDIATE");
    if (result) {
        inTransaction_ = true;
    }
    return result;
}

Result<void> Database::commit() {
    if (!inTransaction_) {
        return Error{ErrorCode::DatabaseError, "Not in transaction"};
    }

    auto result = execute("COMMIT");
    if (result) {
        inTransaction_ = false;
    }
    return result;
}

Result<void> Database::rollback() {
    if (!inTransaction_) {
        return Error{ErrorCode::DatabaseError, "Not in transaction"};
    }

    auto result = execute("ROLLBACK");
    inTransaction_ = false;
    return result;
}

Result<bool> Database::tableExists(const std::string& table) {
    return countPositive("SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?", table);
}

Result<bool> Database::columnExists(const std::string& table, const std::string& column) {
    return countPositive("SELECT COUNT(*) FROM pragma_table_info(?) WHERE name=?", table, column);
}

Result<void> Database::enableWAL() {
    return execute("PRAGMA journal_mode=WAL");
}

// QueryBuilder implementation
QueryBuilder& QueryBuilder::select(const std::vector<std::string>& columns) {
    type_ = QueryType::Select;
    selectColumns_ = columns;
    return *this;
}

QueryBuilder& QueryBuilder::from(const std::string& table) {
    table_ = table;
    return *this;
}

QueryBuilder& QueryBuilder::andWhere(const std::string& condition) {
    whereClauses_.push_back(condition);
    return *this;
}

QueryBuilder& QueryBuilder::orderBy(const std::string& column, bool ascending) {
    orderByClauses_.clear();
    return thenBy(column, ascending);
}

QueryBuilder& QueryBuilder::thenBy(const std::string& column, bool ascending) {
    orderByClauses_.push_back(column + (ascending ? " ASC" : " DESC"));
    return *this;
}

QueryBuilder& QueryBuilder::limit(int limit) {
    limit_ = limit;
    return *this;
}

QueryBuilder& QueryBuilder::insertInto(const std::string& table) {
    type_ = QueryType::Insert;
    table_ = table;
    return *this;
}

QueryBuilder& QueryBuilder::values(const std::vector<std::string>& columns) {
    insertColumns_ = columns;
    return *this;
}

std::string QueryBuilder::build() const {
    std::ostringstream sql;

    switch (type_) {
        case QueryType::Select:
            sql << "SELECT ";
            if (selectColumns_.empty()) {
                sql << "*";
            } else {
                appendJoined(sql, selectColumns_.size(), ", ",
                             [&](size_t i) { sql << selectColumns_[i]; });
            }
            sql << " FROM " << table_;

            if (!whereClauses_.empty()) {
                sql << " WHERE ";
                appendJoined(sql, whereClauses_.size(), " AND ",
                             [&](size_t i) { sql << whereClauses_[i]; });
            }
            if (!orderByClauses_.empty()) {
                sql << " ORDER BY ";
                appendJoined(sql, orderByClauses_.size(), ", ",
                             [&](size_t i) { sql << orderByClauses_[i]; });
            }
            if (limit_ > 0) {
                sql << " LIMIT " << limit_;
            }
            break;

        case QueryType::Insert:
            sql << "INSERT INTO " << table_;
            if (!insertColumns_.empty()) {
                sql << " (";
                appendJoined(sql, insertColumns_.size(), ", ",
                             [&](size_t i) { sql << insertColumns_[i]; });
                sql << ") VALUES (";
                appendJoined(sql, insertColumns_.size(), ", ", [&](size_t) { sql << "?"; });
                sql << ")";
            }
            break;

        case QueryType::None:
            break;
    }

    return sql.str();
}

void QueryBuilder::reset() {
    *this = QueryBuilder{};
}

std::string quoteIdentifier(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 2);
    out.push_back('"');
    for (char c : name) {
        if (c == '"')
            out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // namespace factstore::metadata
