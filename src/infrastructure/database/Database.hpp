#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace vlanvision::infra {

/**
 * @brief RAII wrapper for SQLite prepared statements.
 *
 * @note Non-copyable but moveable.
 */
class Statement {
public:
    /**
     * @brief Takes ownership of a prepared statement handle.
     */
    explicit Statement(sqlite3_stmt* stmt);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    /** @name Parameter binding (1-based index)
     *  @throws std::runtime_error if SQLite rejects the value.
     *  @{ */
    void bind(int index, int value);
    void bind(int index, int64_t value);
    void bind(int index, double value);
    void bind(int index, const std::string& value);
    void bindNull(int index);
    /** @} */

    /**
     * @brief Executes the statement and advances to the next row.
     * @return True if a row is available, false if done.
     * @throws std::runtime_error on any other SQLite result.
     */
    bool step();

    /**
     * @brief Resets the statement and clears its bindings for re-execution.
     */
    void reset();

    /** @name Column access (0-based index)
     *  @{ */
    int columnInt(int index) const;
    int64_t columnInt64(int index) const;
    double columnDouble(int index) const;
    std::string columnText(int index) const;
    bool columnIsNull(int index) const;
    /** @} */

    sqlite3_stmt* handle() const { return stmt_; }

private:
    sqlite3_stmt* stmt_{nullptr};
};

/**
 * @brief SQLite connection holding the device snapshot, job audit trail and alert log.
 *
 * Opens in WAL mode with foreign keys enabled. Schema changes are applied by
 * runMigrations() as numbered, append-only migrations.
 *
 * @note Non-copyable. The connection is opened with SQLITE_OPEN_FULLMUTEX and
 *       may be shared by the repositories across threads.
 */
class Database {
public:
    /**
     * @brief Opens or creates a database at the specified path.
     * @param path File path, or ":memory:" for a private in-memory database.
     * @throws std::runtime_error if the database cannot be opened.
     */
    explicit Database(const std::string& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Executes one or more SQL statements without results.
     * @throws std::runtime_error on SQL error.
     */
    void execute(const std::string& sql);

    /**
     * @brief Prepares a SQL statement.
     * @throws std::runtime_error if preparation fails.
     */
    Statement prepare(const std::string& sql);

    int64_t lastInsertRowId() const;
    int changes() const;

    void beginTransaction();
    void commit();
    void rollback();

    /**
     * @brief Executes a function within a transaction.
     *
     * Commits on success, rolls back and rethrows on exception.
     */
    template <typename Func>
    void transaction(Func&& func) {
        beginTransaction();
        try {
            func();
            commit();
        } catch (...) {
            rollback();
            throw;
        }
    }

    /**
     * @brief Applies pending schema migrations.
     */
    void runMigrations();

    /// Highest applied migration, 0 for a fresh database.
    int schemaVersion();

    /**
     * @brief Executes a SQL statement with bound parameters.
     */
    template <typename... Args>
    void execute(const std::string& sql, Args&&... args) {
        auto stmt = prepare(sql);
        bindAll(stmt, 1, std::forward<Args>(args)...);
        stmt.step();
    }

    /**
     * @brief Executes a query and returns each row as a JSON object keyed by column name.
     */
    template <typename... Args>
    std::vector<nlohmann::json> query(const std::string& sql, Args&&... args) {
        std::vector<nlohmann::json> results;
        auto stmt = prepare(sql);
        if constexpr (sizeof...(args) > 0) {
            bindAll(stmt, 1, std::forward<Args>(args)...);
        }

        std::lock_guard lock(mutex_);
        sqlite3_stmt* rawStmt = stmt.handle();
        int columnCount = sqlite3_column_count(rawStmt);

        while (stmt.step()) {
            nlohmann::json row;
            for (int i = 0; i < columnCount; ++i) {
                const char* name = sqlite3_column_name(rawStmt, i);
                switch (sqlite3_column_type(rawStmt, i)) {
                case SQLITE_INTEGER:
                    row[name] = stmt.columnInt64(i);
                    break;
                case SQLITE_FLOAT:
                    row[name] = stmt.columnDouble(i);
                    break;
                case SQLITE_NULL:
                    row[name] = nullptr;
                    break;
                default:
                    row[name] = stmt.columnText(i);
                    break;
                }
            }
            results.push_back(std::move(row));
        }
        return results;
    }

    /** @name Timestamp storage format ("YYYY-MM-DD HH:MM:SS", UTC)
     *  @{ */
    static std::string formatTimestamp(const std::chrono::system_clock::time_point& tp);
    static std::chrono::system_clock::time_point parseTimestamp(const std::string& str);
    /** @} */

private:
    template <typename T, typename... Rest>
    void bindAll(Statement& stmt, int index, T&& first, Rest&&... rest) {
        bindValue(stmt, index, std::forward<T>(first));
        if constexpr (sizeof...(rest) > 0) {
            bindAll(stmt, index + 1, std::forward<Rest>(rest)...);
        }
    }

    void bindValue(Statement& stmt, int index, int value) { stmt.bind(index, value); }
    void bindValue(Statement& stmt, int index, int64_t value) { stmt.bind(index, value); }
    void bindValue(Statement& stmt, int index, double value) { stmt.bind(index, value); }
    void bindValue(Statement& stmt, int index, const std::string& value) { stmt.bind(index, value); }
    void bindValue(Statement& stmt, int index, const char* value) { stmt.bind(index, std::string(value)); }

    void configureConnection();
    void createMigrationsTable();
    void setVersion(int version);

    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;
};

} // namespace vlanvision::infra
