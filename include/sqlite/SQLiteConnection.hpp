#pragma once

/**
 * @file SQLiteConnection.hpp
 * @brief SQLite implementation of DbConnection.
 *
 * SQLite is file-based and serverless, so a "connection" is an open
 * database file handle. The pool still hands these out like any other
 * connection: transactions are per handle.
 */

#include "DbConnection.hpp"
#include "Errors.hpp"
#include <sqlite3.h>
#include <chrono>
#include <string>

namespace sqlctx {

class SQLiteResultSet;

/**
 * @class SQLiteException
 * @brief Error reported by libsqlite3, carrying the extended result code.
 */
class SQLiteException : public DriverError {
public:
    SQLiteException(int code, const std::string& message)
        : DriverError(code, "SQLite error " + std::to_string(code) + ": " + message) {}
};

/**
 * @class SQLiteConnection
 * @brief RAII wrapper for an SQLite database file connection.
 *
 * The connection is automatically closed when the object is destroyed.
 *
 * Thread Safety:
 * - Opened with SQLITE_OPEN_FULLMUTEX for serialized mode
 * - Closed with sqlite3_close_v2, so statements of cursors that outlive the
 *   connection can still be finalized
 */
class SQLiteConnection : public DbConnection {
public:
    /**
     * @brief Open a connection to an SQLite database file.
     * @param dbPath Path to the database file, or ":memory:".
     * @param busyTimeout How long to wait for locks held by other connections.
     *
     * Creates the database file if it doesn't exist.
     * @throws SQLiteException if the file cannot be opened.
     */
    explicit SQLiteConnection(const std::string& dbPath,
                              std::chrono::milliseconds busyTimeout = std::chrono::milliseconds(5000));

    ~SQLiteConnection() override;

    sqlite3* get() const { return m_db; }

    /**
     * @brief Run every statement of `statement.sql` in order.
     *
     * Parameters are consumed left to right by the statements that use them.
     * The result is the one of the last statement.
     */
    QueryResult execute(const CompiledStatement& statement, Deadline deadline = std::nullopt) override;

    // @throws InterfaceError if the SQL holds more than one statement
    std::unique_ptr<DbCursor> openCursor(const CompiledStatement& statement) override;

    // sqlite3_get_autocommit() is zero while a transaction is open
    bool inTransaction() const override;

    bool isValid() const override { return m_db != nullptr; }
    bool ping() override;

    /**
     * @brief Compile the first statement of `sql`.
     * @param tail Set to the text after the compiled statement.
     * @return Empty result set when `sql` holds only whitespace or comments.
     * @throws SQLiteException if the statement does not compile.
     */
    SQLiteResultSet prepareOne(const char* sql, const char** tail);

    /**
     * @brief Step a bound statement to completion and buffer its rows.
     *
     * The deadline is enforced with a progress handler while it runs.
     */
    QueryResult run(SQLiteResultSet& statement, Deadline deadline);

    const char* error() const;
    int errorCode() const;
    int64_t lastInsertRowId() const;
    int changes() const;

    const std::string& path() const { return m_path; }

protected:
    // Single statement kept compiled, reset and rebound per execution
    std::unique_ptr<DbPreparedStatement> prepareStatement(const std::string& sql) override;

private:
    static int progressHandler(void* data);

    sqlite3* m_db = nullptr;
    std::string m_path;
    Deadline m_deadline;  // Active only while execute() runs
};

}  // namespace sqlctx
