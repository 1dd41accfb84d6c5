#pragma once

/**
 * @file DbConnection.hpp
 * @brief Physical connection interface implemented by every backend.
 *
 * A DbConnection is one open connection to the database server (or one open
 * SQLite file handle). The connection layer never talks to libsqlite3, libpq
 * or libmysqlclient directly; it only uses this interface, which is also what
 * the pools hand out and take back.
 */

#include "Query.hpp"
#include "Value.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlctx {

using Clock = std::chrono::steady_clock;
using Deadline = std::optional<Clock::time_point>;

/**
 * @struct QueryResult
 * @brief Fully buffered outcome of one statement.
 */
struct QueryResult {
    Row::Columns columns;       ///< Column names shared by all rows
    std::vector<Row> rows;      ///< Rows returned by the statement
    std::string statusTag;      ///< Driver status, e.g. "SELECT 1", "UPDATE 3"
    uint64_t rowsAffected = 0;  ///< Rows changed by DML statements
};

/**
 * @class DbCursor
 * @brief Streaming access to the rows of one statement.
 *
 * Cursors are owned by the caller but borrow the DbConnection they were
 * opened on; they must not be used after that connection went back to its
 * pool. The Cursor class of the connection layer guarantees that.
 */
class DbCursor {
public:
    virtual ~DbCursor() = default;

    // Next row, or nothing once exhausted
    virtual std::optional<Row> fetchOne() = 0;

    // Up to `count` rows, fewer at the end of the result
    virtual std::vector<Row> fetchMany(size_t count);

    // Skip up to `count` rows, returns how many were skipped
    virtual size_t skip(size_t count);

    virtual void close() = 0;
};

/**
 * @class DbPreparedStatement
 * @brief One statement parsed once and executed with fresh parameters.
 *
 * Owned by the DbConnection it was prepared on. The destructor only frees
 * local resources; close() also drops the statement on the server.
 */
class DbPreparedStatement {
public:
    virtual ~DbPreparedStatement() = default;

    virtual QueryResult execute(const std::vector<Value>& params, Deadline deadline = std::nullopt) = 0;
    virtual std::unique_ptr<DbCursor> openCursor(const std::vector<Value>& params) = 0;

    virtual void close() {}
};

class DbConnection {
public:
    virtual ~DbConnection() = default;

    // Non-copyable
    DbConnection(const DbConnection&) = delete;
    DbConnection& operator=(const DbConnection&) = delete;

    /**
     * @brief Execute one compiled statement and buffer its result.
     * @param statement SQL in the dialect's parameter style plus parameters.
     * @param deadline Optional point in time after which the statement is
     *        interrupted and TimeoutError is thrown.
     * @throws DriverError subclass on database errors.
     */
    virtual QueryResult execute(const CompiledStatement& statement, Deadline deadline = std::nullopt) = 0;

    /**
     * @brief Open a streaming cursor on the statement.
     */
    virtual std::unique_ptr<DbCursor> openCursor(const CompiledStatement& statement) = 0;

    // True while a transaction (or savepoint) is open on this connection
    virtual bool inTransaction() const = 0;

    // Local state check, no round trip
    virtual bool isValid() const = 0;

    // Round trip to the server
    virtual bool ping() = 0;

    /**
     * @brief Bring the connection back to a clean state before reuse.
     *
     * Called by pools on return; rolls back any open transaction.
     */
    virtual void reset();

    // Unique savepoint name for this connection
    std::string nextSavepointName();

    // ----- Prepared statements -----

    /**
     * @brief Prepare `sql`, which is already in the dialect's parameter style.
     *
     * The statement stays on this connection until closePrepared() or
     * closeAllPrepared().
     * @return Id to look the statement up with prepared().
     * @throws DriverError subclass if the statement does not compile.
     */
    uint64_t prepare(const std::string& sql);

    // nullptr once closed
    DbPreparedStatement* prepared(uint64_t id) const;

    void closePrepared(uint64_t id);

    // Close every prepared statement; errors are logged, never thrown
    void closeAllPrepared() noexcept;

    size_t preparedCount() const { return m_prepared.size(); }

protected:
    DbConnection() = default;

    /**
     * @brief Backend statement for prepare().
     *
     * The default sends the SQL again through execute() and openCursor() on
     * every execution; backends with server-side statements override it.
     */
    virtual std::unique_ptr<DbPreparedStatement> prepareStatement(const std::string& sql);

private:
    uint64_t m_savepointCounter = 0;
    uint64_t m_preparedCounter = 0;
    std::map<uint64_t, std::unique_ptr<DbPreparedStatement>> m_prepared;
};

}  // namespace sqlctx
