#pragma once

/**
 * @file MySQLConnection.hpp
 * @brief libmysqlclient implementation of DbConnection.
 *
 * Parameters are interpolated on the client with mysql_real_escape_string(),
 * so statements go through mysql_real_query() and results come back in the
 * text protocol. Cursors use mysql_use_result(); while one is open, the
 * connection owns its result, and any other statement on the connection
 * first frees it. The cursor then reports itself invalidated instead of
 * reading from a connection that moved on.
 *
 * Prepared statements are the exception: they use mysql_stmt_prepare() and
 * the binary protocol, with results fetched as text and converted like the
 * text protocol's.
 */

#include "Config.hpp"
#include "DbConnection.hpp"
#include "Errors.hpp"
#include "MySQLResultSet.hpp"
#include <mysql/mysql.h>
#include <memory>
#include <string>
#include <cstdint>

namespace sqlctx {

// Exception for MySQL errors
class MySQLException : public DriverError {
public:
    MySQLException(unsigned int errorCode, const std::string& message, const std::string& sqlState = "");
    explicit MySQLException(MYSQL* conn);
};

/**
 * @class MySQLConnection
 * @brief One MYSQL handle, closed with mysql_close() on destruction.
 *
 * A statement with a deadline is watched by a helper thread; when the
 * deadline passes, the thread opens a second session and issues
 * `KILL QUERY` for this connection's thread id. The interrupted statement
 * is then reported as TimeoutError.
 */
class MySQLConnection : public DbConnection {
public:
    /**
     * @brief Connect with the given configuration.
     * @throws MySQLException if the server cannot be reached.
     */
    explicit MySQLConnection(const ConnectionConfig& config);

    ~MySQLConnection() override;

    MYSQL* get() const { return m_conn; }

    QueryResult execute(const CompiledStatement& statement, Deadline deadline = std::nullopt) override;
    std::unique_ptr<DbCursor> openCursor(const CompiledStatement& statement) override;

    // SERVER_STATUS_IN_TRANS of the last reply
    bool inTransaction() const override;

    bool isValid() const override { return m_conn != nullptr; }

    // mysql_ping() returns 0 on success
    bool ping() override;

    // Drops an open cursor result before rolling back
    void reset() override;

    /**
     * @brief Replace `?` placeholders with escaped literals.
     *
     * Question marks inside quoted strings, quoted identifiers and comments
     * are not placeholders.
     * @throws InterfaceError when the number of parameters does not match.
     */
    std::string interpolate(const std::string& sql, const std::vector<Value>& params) const;

    // Escaped and quoted string literal
    std::string escapeString(const std::string& str) const;

    /**
     * @brief Free the result of the open cursor, if any.
     *
     * Reads and discards its remaining rows, plus any further result sets of
     * a multi-statement query.
     */
    void discardActiveResult();

    const char* error() const;
    unsigned int errorNumber() const;
    uint64_t affectedRows() const;
    uint64_t insertId() const;

    /**
     * @brief Open a raw handle with the configured options.
     * @throws MySQLException on failure.
     */
    static MYSQL* openHandle(const ConnectionConfig& config);

    const ConnectionConfig& config() const { return m_config; }

protected:
    std::unique_ptr<DbPreparedStatement> prepareStatement(const std::string& sql) override;

private:
    void query(const std::string& sql);

    ConnectionConfig m_config;
    MYSQL* m_conn = nullptr;
    std::shared_ptr<MySQLResultSet> m_activeResult;
};

/**
 * @class MySQLCursor
 * @brief Reads an unbuffered result row by row.
 */
class MySQLCursor : public DbCursor {
public:
    MySQLCursor(MySQLConnection* conn, std::weak_ptr<MySQLResultSet> result);

    std::optional<Row> fetchOne() override;
    void close() override;

private:
    MySQLConnection* m_conn;
    std::weak_ptr<MySQLResultSet> m_result;
    Row::Columns m_columns;
    bool m_done = false;
};

/**
 * @class MySQLPreparedStatement
 * @brief MYSQL_STMT executed with bound parameters.
 *
 * The destructor closes the statement handle; after mysql_close() of the
 * connection that only frees client memory.
 */
class MySQLPreparedStatement : public DbPreparedStatement {
public:
    MySQLPreparedStatement(MySQLConnection* conn, MYSQL_STMT* stmt, std::string sql);
    ~MySQLPreparedStatement() override;

    MySQLPreparedStatement(const MySQLPreparedStatement&) = delete;
    MySQLPreparedStatement& operator=(const MySQLPreparedStatement&) = delete;

    QueryResult execute(const std::vector<Value>& params, Deadline deadline) override;

    // Streams through the text protocol, mysql_use_result() has no statement form
    std::unique_ptr<DbCursor> openCursor(const std::vector<Value>& params) override;

    void close() override;

private:
    void bindParams(const std::vector<Value>& params);
    QueryResult fetchResult();

    MySQLConnection* m_conn;
    MYSQL_STMT* m_stmt;
    std::string m_sql;

    // Parameter buffers referenced by the bound MYSQL_BIND array
    std::vector<MYSQL_BIND> m_binds;
    std::vector<int64_t> m_integers;
    std::vector<double> m_reals;
    std::vector<std::string> m_texts;
    std::vector<unsigned long> m_lengths;
};

}  // namespace sqlctx
