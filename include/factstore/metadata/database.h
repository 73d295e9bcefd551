#pragma once

#include <factstore/core/types.h>
#include <sqlite3.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace factstore::metadata {

/**
 * @brief How Database::open treats a missing file
 */
enum class ConnectionMode {
    ReadWrite, ///< Existing database only
    Create     ///< Create the file if it does not exist
};

/**
 * @brief Prepared statement with RAII finalization
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    // Move-only
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Bind parameters to statement (1-based index)
     */
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const std::string& value) {
        return bind(index, std::string_view(value));
    }
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }
    Result<void> bind(int index, std::span<const std::byte> blob);

    /**
     * @brief Bind a value or NULL
     */
    template<typename T> Result<void> bind(int index, const std::optional<T>& value) {
        if (!value)
            return bind(index, nullptr);
        return bind(index, *value);
    }

    /**
     * @brief Bind consecutive parameters starting at index 1
     */
    template<typename... Args> Result<void> bindAll(Args&&... args) {
        return bindHelper(1, std::forward<Args>(args)...);
    }

    /**
     * @brief Run a statement that returns no rows
     */
    Result<void> execute();

    /**
     * @brief Advance to the next row
     * @return true if a row is available, false when done
     */
    Result<bool> step();

    // Column accessors (0-based index)
    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    std::optional<std::string> getOptionalString(int column) const;
    std::vector<std::byte> getBlob(int column) const;
    bool isNull(int column) const;

    /**
     * @brief Reset for re-execution; bindings are kept
     */
    Result<void> reset();

private:
    // One sqlite3_step with SQLITE_BUSY/SQLITE_LOCKED retries
    int stepWithRetry();

    sqlite3_stmt* stmt_ = nullptr;

    template<typename T, typename... Rest>
    Result<void> bindHelper(int index, T&& value, Rest&&... rest) {
        auto result = bind(index, std::forward<T>(value));
        if (!result)
            return result;
        if constexpr (sizeof...(rest) > 0) {
            return bindHelper(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }

    Result<void> bindHelper(int) { return {}; }
};

/**
 * @brief Single SQLite connection
 */
class Database {
public:
    Database() = default;
    ~Database();

    // Move-only
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Open a connection with a 5s busy timeout
     */
    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadWrite);

    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Execute one or more statements that return no rows
     */
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();

    /**
     * @brief Execute within transaction; rolls back when @p func fails
     */
    template<typename Func> Result<void> transaction(Func&& func) {
        auto beginResult = beginTransaction();
        if (!beginResult)
            return beginResult;

        try {
            Result<void> result = func();
            if (!result) {
                (void)rollback();
                return result;
            }
            return commit();
        } catch (...) {
            (void)rollback();
            throw;
        }
    }

    [[nodiscard]] bool inTransaction() const { return inTransaction_; }

    Result<bool> tableExists(const std::string& table);
    Result<bool> columnExists(const std::string& table, const std::string& column);

    Result<void> enableWAL();

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    // Runs a single-row COUNT query with string parameters
    template<typename... Args> Result<bool> countPositive(const std::string& sql, Args&&... args) {
        auto stmtResult = prepare(sql);
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto bound = stmt.bindAll(std::forward<Args>(args)...);
        if (!bound)
            return bound.error();
        auto row = stmt.step();
        if (!row)
            return row.error();
        return row.value() && stmt.getInt64(0) > 0;
    }

    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
};

/**
 * @brief SQL text builder for the SELECT and INSERT shapes the stores use
 */
class QueryBuilder {
public:
    QueryBuilder() = default;

    // SELECT
    QueryBuilder& select(const std::vector<std::string>& columns = {});
    QueryBuilder& from(const std::string& table);
    QueryBuilder& andWhere(const std::string& condition);
    QueryBuilder& orderBy(const std::string& column, bool ascending = true);
    QueryBuilder& thenBy(const std::string& column, bool ascending = true);
    QueryBuilder& limit(int limit);

    // INSERT
    QueryBuilder& insertInto(const std::string& table);
    QueryBuilder& values(const std::vector<std::string>& columns);

    [[nodiscard]] std::string build() const;

    void reset();

private:
    enum class QueryType { None, Select, Insert };

    QueryType type_ = QueryType::None;
    std::string table_;
    std::vector<std::string> selectColumns_;
    std::vector<std::string> insertColumns_;
    std::vector<std::string> whereClauses_;
    std::vector<std::string> orderByClauses_;
    int limit_ = -1;
};

/**
 * @brief Quote an identifier for SQL ("name" with embedded quotes doubled)
 */
std::string quoteIdentifier(std::string_view name);

} // namespace factstore::metadata
