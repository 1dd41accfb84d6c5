#pragma once

/**
 * @file SQLiteResultSet.hpp
 * @brief RAII wrapper for SQLite prepared statements and the cursor built on it.
 */

#include "DbConnection.hpp"
#include "Value.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>

namespace sqlctx {

class SQLiteConnection;

/**
 * @class SQLiteResultSet
 * @brief RAII wrapper for a sqlite3_stmt.
 *
 * SQLite uses step() to both execute and fetch rows. Each call to step()
 * advances to the next row (or completes the statement for DML).
 *
 * Usage:
 * @code
 *   const char* tail = nullptr;
 *   SQLiteResultSet result = conn.prepareOne("SELECT id, name FROM employees WHERE id > ?", &tail);
 *   result.bind({Value(10)});
 *   while (result.step()) {
 *       Row row = result.readRow(columns);
 *   }
 * @endcode
 *
 * Errors are raised as SQLiteException, with the message of the owning
 * database handle.
 */
class SQLiteResultSet {
public:
    /**
     * @brief Construct a result set wrapper.
     * @param stmt sqlite3_stmt handle to manage (takes ownership), or nullptr.
     */
    explicit SQLiteResultSet(sqlite3_stmt* stmt = nullptr);

    /**
     * @brief Destructor - finalizes the statement if still owned.
     */
    ~SQLiteResultSet();

    // Non-copyable
    SQLiteResultSet(const SQLiteResultSet&) = delete;
    SQLiteResultSet& operator=(const SQLiteResultSet&) = delete;

    // Movable
    SQLiteResultSet(SQLiteResultSet&& other) noexcept;
    SQLiteResultSet& operator=(SQLiteResultSet&& other) noexcept;

    sqlite3_stmt* get() const { return m_stmt; }

    operator bool() const { return m_stmt != nullptr; }

    /**
     * @brief Bind positional parameters, 1-based in SQLite.
     * @throws SQLiteException on bind errors (e.g. too many parameters).
     */
    void bind(const std::vector<Value>& params);

    /**
     * @brief Step to the next row.
     * @return true if a row is available, false when done.
     * @throws SQLiteException on errors, TimeoutError when interrupted.
     */
    bool step();

    int columnCount() const;
    std::string columnName(int index) const;

    // Column names as shared by every row of this statement
    Row::Columns columns() const;

    /**
     * @brief Get a column value with its storage class.
     *
     * INTEGER maps to int64_t, FLOAT to double, TEXT to string and BLOB to
     * Blob, following SQLite's dynamic typing per value.
     */
    Value value(int index) const;

    // Current row
    Row readRow(const Row::Columns& columns) const;

    // True for statements that do not write (SELECT, read-only PRAGMA)
    bool isReadOnly() const;

    // Rewind to run again and clear the bound parameters
    void reset();

    /**
     * @brief Finalize the statement and release resources.
     *
     * Safe after the database handle was closed with sqlite3_close_v2.
     */
    void finalize();

private:
    [[noreturn]] void raise(int rc) const;

    sqlite3_stmt* m_stmt;
};

/**
 * @class SQLiteCursor
 * @brief Streams the rows of one statement by stepping it on demand.
 */
class SQLiteCursor : public DbCursor {
public:
    explicit SQLiteCursor(SQLiteResultSet result);

    std::optional<Row> fetchOne() override;
    void close() override;

private:
    SQLiteResultSet m_result;
    Row::Columns m_columns;
    bool m_done = false;
};

/**
 * @class SQLitePreparedStatement
 * @brief Keeps one compiled sqlite3_stmt for repeated execution.
 *
 * Cursors compile their own copy of the statement, so executions may run
 * while a cursor of the same statement is open.
 */
class SQLitePreparedStatement : public DbPreparedStatement {
public:
    SQLitePreparedStatement(SQLiteConnection& connection, SQLiteResultSet statement);

    QueryResult execute(const std::vector<Value>& params, Deadline deadline) override;
    std::unique_ptr<DbCursor> openCursor(const std::vector<Value>& params) override;
    void close() override;

private:
    SQLiteConnection& m_connection;
    SQLiteResultSet m_statement;
};

}  // namespace sqlctx
