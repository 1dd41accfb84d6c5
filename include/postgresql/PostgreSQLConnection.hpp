#pragma once

/**
 * @file PostgreSQLConnection.hpp
 * @brief libpq implementation of DbConnection.
 *
 * PostgreSQL libpq API Usage:
 * - PQconnectdb() with a keyword/value connection string
 * - PQsendQueryParams() + PQgetResult() for parameterized queries, so a
 *   statement can be cancelled with PQcancel() when its deadline passes
 * - PQtransactionStatus() for transaction state
 * - DECLARE / FETCH / CLOSE for server-side cursors
 * - PQsendPrepare() / PQsendQueryPrepared() for named prepared statements
 */

#include "DbConnection.hpp"
#include "Errors.hpp"
#include "PostgreSQLResultSet.hpp"
#include <libpq-fe.h>
#include <deque>
#include <string>
#include <cstdint>

namespace sqlctx {

struct ConnectionConfig;

/**
 * @class PostgreSQLException
 * @brief Error reported by the server or libpq, with its SQLSTATE.
 */
class PostgreSQLException : public DriverError {
public:
    PostgreSQLException(int code, const std::string& message, const std::string& sqlState = "")
        : DriverError(code, "PostgreSQL error" + (sqlState.empty() ? std::string() : " " + sqlState) +
                                ": " + message,
                      sqlState) {}
};

/**
 * @class PostgreSQLConnection
 * @brief One PGconn, owned for the lifetime of the object.
 *
 * Thread Safety:
 * - A PGconn must not be used from two threads at once; the connection
 *   handle layer serializes all use of one physical connection.
 */
class PostgreSQLConnection : public DbConnection {
public:
    /**
     * @brief Connect with the given configuration.
     * @throws PostgreSQLException if the server cannot be reached.
     */
    explicit PostgreSQLConnection(const ConnectionConfig& config);

    // Closes the PGconn with PQfinish()
    ~PostgreSQLConnection() override;

    PGconn* get() const { return m_conn; }

    QueryResult execute(const CompiledStatement& statement, Deadline deadline = std::nullopt) override;
    std::unique_ptr<DbCursor> openCursor(const CompiledStatement& statement) override;

    // PQTRANS_INTRANS, PQTRANS_INERROR or PQTRANS_ACTIVE
    bool inTransaction() const override;

    // Checks PQstatus() == CONNECTION_OK
    bool isValid() const override;

    // Executes "SELECT 1"
    bool ping() override;

    /**
     * @brief Run a statement and return the raw result.
     * @throws PostgreSQLException when the result is not OK,
     *         TimeoutError when the deadline passes and the query is cancelled.
     */
    PostgreSQLResultSet run(const std::string& sql, const std::vector<Value>& params,
                            Deadline deadline = std::nullopt);

    // run() for a statement prepared under `name`
    PostgreSQLResultSet runPrepared(const std::string& name, const std::vector<Value>& params,
                                    Deadline deadline = std::nullopt);

    // Rows, status tag and affected row count of a result
    static QueryResult buffer(const PostgreSQLResultSet& result);

    const char* error() const;

    /**
     * @brief Escape an identifier (table name, column name).
     * @return Escaped identifier wrapped in double quotes.
     */
    std::string escapeIdentifier(const std::string& identifier) const;

    // Build the libpq connection string, values quoted as needed
    static std::string connectionString(const ConnectionConfig& config);

protected:
    // PQsendPrepare() under a name unique to this connection
    std::unique_ptr<DbPreparedStatement> prepareStatement(const std::string& sql) override;

private:
    // Wait for the socket until the pending query finished or the deadline passed
    bool waitForResult(Deadline deadline);
    void cancelRunning();

    // Collect the result of the query sent last
    PostgreSQLResultSet finish(Deadline deadline);

    PGconn* m_conn = nullptr;
    uint64_t m_cursorCounter = 0;
    uint64_t m_statementCounter = 0;
};

/**
 * @class PostgreSQLCursor
 * @brief Server-side cursor read in batches with FETCH.
 *
 * The cursor only lives inside the transaction it was declared in. close()
 * skips the CLOSE statement once that transaction is over, since the server
 * already dropped the cursor.
 */
class PostgreSQLCursor : public DbCursor {
public:
    static constexpr size_t kFetchSize = 100;

    PostgreSQLCursor(PostgreSQLConnection* conn, std::string name);

    std::optional<Row> fetchOne() override;
    std::vector<Row> fetchMany(size_t count) override;
    size_t skip(size_t count) override;
    void close() override;

private:
    bool fill(size_t count);

    PostgreSQLConnection* m_conn;
    std::string m_name;
    std::deque<Row> m_buffer;
    bool m_exhausted = false;
    bool m_closed = false;
};

/**
 * @class PostgreSQLPreparedStatement
 * @brief Named server-side statement, dropped with DEALLOCATE on close().
 */
class PostgreSQLPreparedStatement : public DbPreparedStatement {
public:
    PostgreSQLPreparedStatement(PostgreSQLConnection* conn, std::string name, std::string sql);

    QueryResult execute(const std::vector<Value>& params, Deadline deadline) override;
    std::unique_ptr<DbCursor> openCursor(const std::vector<Value>& params) override;
    void close() override;

    const std::string& name() const { return m_name; }

private:
    PostgreSQLConnection* m_conn;
    std::string m_name;
    std::string m_sql;
};

}  // namespace sqlctx
