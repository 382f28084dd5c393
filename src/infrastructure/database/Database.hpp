#pragma once

#include <mutex>
#include <sqlite3.h>
#include <string>

namespace hostwatch::infra {

/**
 * @brief RAII wrapper for SQLite prepared statements.
 *
 * Binding and stepping failures throw std::runtime_error.
 *
 * @note This class is non-copyable but moveable.
 */
class Statement {
public:
    /**
     * @brief Constructs a Statement from a raw SQLite statement handle.
     * @param stmt SQLite prepared statement handle (takes ownership).
     */
    explicit Statement(sqlite3_stmt* stmt);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    // Parameter indexes are 1-based.
    void bind(int index, int value);
    void bind(int index, const std::string& value);

    /**
     * @brief Executes the statement and advances to the next row.
     * @return True if a row is available, false if done.
     */
    bool step();

    /**
     * @brief Resets the statement and clears its bindings for re-execution.
     */
    void reset();

    // Column indexes are 0-based.
    int columnInt(int index) const;
    std::string columnText(int index) const;
    bool columnIsNull(int index) const;

private:
    sqlite3_stmt* stmt_{nullptr};
};

/**
 * @brief SQLite database connection with schema migrations.
 *
 * Opens the database in WAL mode so that the daemon and one-shot command
 * invocations can share the file.
 *
 * @note This class is non-copyable.
 */
class Database {
public:
    /**
     * @brief Opens or creates a database at the specified path.
     * @param path File path to the SQLite database.
     * @throws std::runtime_error if database cannot be opened.
     */
    explicit Database(const std::string& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Executes a SQL statement without returning results.
     * @throws std::runtime_error on SQL error.
     */
    void execute(const std::string& sql);

    /**
     * @brief Prepares a SQL statement for execution.
     * @throws std::runtime_error if preparation fails.
     */
    Statement prepare(const std::string& sql);

    /**
     * @brief Returns the number of rows affected by the last statement.
     */
    int changes() const;

    void beginTransaction();
    void commit();
    void rollback();

    /**
     * @brief Executes a function within a transaction.
     *
     * Commits on success. On exception the transaction is rolled back and
     * the exception is rethrown.
     *
     * @tparam Func Callable type.
     * @param func Function to execute within the transaction.
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
     * @brief Brings the schema up to the latest version.
     */
    void runMigrations();

    /**
     * @brief Executes a SQL statement with bound parameters.
     * @tparam Args Parameter types.
     * @param sql SQL statement with placeholders.
     * @param args Values to bind to placeholders.
     */
    template <typename... Args>
    void execute(const std::string& sql, Args&&... args) {
        auto stmt = prepare(sql);
        bindAll(stmt, 1, std::forward<Args>(args)...);
        stmt.step();
    }

    /**
     * @brief Returns the current schema version.
     */
    int schemaVersion();

private:
    template <typename T, typename... Rest>
    void bindAll(Statement& stmt, int index, T&& first, Rest&&... rest) {
        bindValue(stmt, index, std::forward<T>(first));
        if constexpr (sizeof...(rest) > 0) {
            bindAll(stmt, index + 1, std::forward<Rest>(rest)...);
        }
    }

    void bindValue(Statement& stmt, int index, int value) { stmt.bind(index, value); }
    void bindValue(Statement& stmt, int index, const std::string& value) { stmt.bind(index, value); }
    void bindValue(Statement& stmt, int index, const char* value) { stmt.bind(index, std::string(value)); }

    void configureConnection();
    void createMigrationsTable();
    void setVersion(int version);

    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;
};

} // namespace hostwatch::infra
