/**
 * @file MySQLConnection.cpp
 * @brief Implementation of the MySQL DbConnection.
 */

#include "MySQLConnection.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <type_traits>

namespace sqlctx {

namespace {

std::string leadingKeyword(const std::string& sql) {
    size_t start = 0;
    while (start < sql.size() && std::isspace(static_cast<unsigned char>(sql[start]))) {
        ++start;
    }
    size_t end = start;
    while (end < sql.size() && std::isalpha(static_cast<unsigned char>(sql[end]))) {
        ++end;
    }
    std::string keyword = sql.substr(start, end - start);
    std::transform(keyword.begin(), keyword.end(), keyword.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return keyword;
}

// bool in MySQL 8, my_bool in older and MariaDB headers
using NullFlag = std::remove_pointer_t<decltype(MYSQL_BIND::is_null)>;

MySQLException statementError(MYSQL_STMT* stmt) {
    return MySQLException(mysql_stmt_errno(stmt), mysql_stmt_error(stmt), mysql_stmt_sqlstate(stmt));
}

std::string hexLiteral(const Blob& blob) {
    static const char* digits = "0123456789ABCDEF";
    std::string literal = "X'";
    literal.reserve(blob.size() * 2 + 3);
    for (uint8_t byte : blob) {
        literal += digits[byte >> 4];
        literal += digits[byte & 0x0F];
    }
    literal += '\'';
    return literal;
}

/**
 * Kills the running query of a connection once a deadline passes.
 * Stopped (and joined) by the destructor.
 */
class QueryWatchdog {
public:
    QueryWatchdog(const ConnectionConfig& config, unsigned long threadId, Clock::time_point deadline)
        : m_thread([this, config, threadId, deadline]() { watch(config, threadId, deadline); }) {}

    ~QueryWatchdog() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_done = true;
        }
        m_cv.notify_all();
        m_thread.join();
    }

    QueryWatchdog(const QueryWatchdog&) = delete;
    QueryWatchdog& operator=(const QueryWatchdog&) = delete;

    bool fired() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_fired;
    }

private:
    void watch(const ConnectionConfig& config, unsigned long threadId, Clock::time_point deadline) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_cv.wait_until(lock, deadline, [this] { return m_done; })) {
                return;
            }
            m_fired = true;
        }

        mysql_thread_init();
        try {
            MYSQL* killer = MySQLConnection::openHandle(config);
            std::string sql = "KILL QUERY " + std::to_string(threadId);
            if (mysql_real_query(killer, sql.c_str(), sql.size()) != 0) {
                spdlog::warn("Failed to interrupt MySQL query {}: {}", threadId, mysql_error(killer));
            }
            mysql_close(killer);
        } catch (const MySQLException& e) {
            spdlog::warn("Failed to interrupt MySQL query {}: {}", threadId, e.what());
        }
        mysql_thread_end();
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_done = false;
    bool m_fired = false;
    std::thread m_thread;  // Last member, starts after the state above
};

}  // namespace

// ============================================================================
// MySQLException
// ============================================================================

MySQLException::MySQLException(unsigned int errorCode, const std::string& message, const std::string& sqlState)
    : DriverError(static_cast<int>(errorCode),
                  "MySQL error " + std::to_string(errorCode) + ": " + message, sqlState) {}

MySQLException::MySQLException(MYSQL* conn)
    : MySQLException(mysql_errno(conn), mysql_error(conn), mysql_sqlstate(conn)) {}

// ============================================================================
// Construction and Destruction
// ============================================================================

MYSQL* MySQLConnection::openHandle(const ConnectionConfig& config) {
    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        throw MySQLException(0, "Failed to initialize MySQL connection");
    }

    // Set options
    unsigned int timeout = static_cast<unsigned int>(
        std::max<long long>(1, config.connect_timeout.count() / 1000));
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);

    unsigned int readTimeout = static_cast<unsigned int>(config.read_timeout.count() / 1000);
    mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &readTimeout);

    unsigned int writeTimeout = static_cast<unsigned int>(config.write_timeout.count() / 1000);
    mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &writeTimeout);

    // SSL options
    if (config.use_ssl) {
        if (!config.ssl_key.empty()) mysql_options(conn, MYSQL_OPT_SSL_KEY, config.ssl_key.c_str());
        if (!config.ssl_cert.empty()) mysql_options(conn, MYSQL_OPT_SSL_CERT, config.ssl_cert.c_str());
        if (!config.ssl_ca.empty()) mysql_options(conn, MYSQL_OPT_SSL_CA, config.ssl_ca.c_str());
    }

    // Connect
    const char* socket = config.socket.empty() ? nullptr : config.socket.c_str();
    const char* db = config.database.empty() ? nullptr : config.database.c_str();

    if (!mysql_real_connect(conn,
                            config.host.c_str(),
                            config.user.c_str(),
                            config.password.c_str(),
                            db,
                            config.port,
                            socket,
                            CLIENT_MULTI_STATEMENTS)) {
        unsigned int err = mysql_errno(conn);
        std::string msg = mysql_error(conn);
        std::string state = mysql_sqlstate(conn);
        mysql_close(conn);
        throw MySQLException(err, "Failed to connect to MySQL: " + msg, state);
    }

    // Set character set to UTF-8
    mysql_set_character_set(conn, "utf8mb4");
    return conn;
}

MySQLConnection::MySQLConnection(const ConnectionConfig& config)
    : m_config(config),
      m_conn(openHandle(config)) {
    spdlog::debug("Connected to MySQL server {} (thread id {})", config.host, mysql_thread_id(m_conn));
}

MySQLConnection::~MySQLConnection() {
    m_activeResult.reset();
    if (m_conn) {
        mysql_close(m_conn);
    }
}

// ============================================================================
// Parameter Interpolation
// ============================================================================

std::string MySQLConnection::escapeString(const std::string& str) const {
    std::string buffer(str.size() * 2 + 1, '\0');
    unsigned long length = mysql_real_escape_string(m_conn, &buffer[0], str.c_str(), str.size());
    buffer.resize(length);
    return "'" + buffer + "'";
}

std::string MySQLConnection::interpolate(const std::string& sql, const std::vector<Value>& params) const {
    std::string result;
    result.reserve(sql.size() + params.size() * 8);
    size_t used = 0;

    size_t i = 0;
    while (i < sql.size()) {
        char c = sql[i];

        // Quoted text: backslash escapes and doubled quotes
        if (c == '\'' || c == '"' || c == '`') {
            size_t end = i + 1;
            while (end < sql.size()) {
                if (sql[end] == '\\' && c != '`') {
                    end += 2;
                    continue;
                }
                if (sql[end] == c) {
                    if (end + 1 < sql.size() && sql[end + 1] == c) {
                        end += 2;
                        continue;
                    }
                    break;
                }
                ++end;
            }
            end = std::min(end + 1, sql.size());
            result.append(sql, i, end - i);
            i = end;
            continue;
        }

        if ((c == '-' && i + 1 < sql.size() && sql[i + 1] == '-') || c == '#') {
            size_t end = sql.find('\n', i);
            if (end == std::string::npos) end = sql.size();
            result.append(sql, i, end - i);
            i = end;
            continue;
        }

        if (c == '/' && i + 1 < sql.size() && sql[i + 1] == '*') {
            size_t end = sql.find("*/", i + 2);
            end = (end == std::string::npos) ? sql.size() : end + 2;
            result.append(sql, i, end - i);
            i = end;
            continue;
        }

        if (c == '?') {
            if (used >= params.size()) {
                throw InterfaceError("Not enough parameters for the statement placeholders");
            }
            const Value& param = params[used++];
            switch (param.type()) {
                case Value::Type::Null:
                    result += "NULL";
                    break;
                case Value::Type::Integer:
                case Value::Type::Real:
                    result += param.asString();
                    break;
                case Value::Type::Text:
                    result += escapeString(param.asString());
                    break;
                case Value::Type::Blob:
                    result += hexLiteral(param.asBlob());
                    break;
            }
            ++i;
            continue;
        }

        result += c;
        ++i;
    }

    if (used != params.size()) {
        throw InterfaceError("Statement uses " + std::to_string(used) + " parameters but " +
                             std::to_string(params.size()) + " were given");
    }
    return result;
}

// ============================================================================
// Query Execution
// ============================================================================

void MySQLConnection::query(const std::string& sql) {
    // mysql_real_query() is preferred over mysql_query() for binary safety
    if (mysql_real_query(m_conn, sql.c_str(), sql.size()) != 0) {
        throw MySQLException(m_conn);
    }
}

QueryResult MySQLConnection::execute(const CompiledStatement& statement, Deadline deadline) {
    if (!m_conn) {
        throw InterfaceError("MySQL connection is closed");
    }

    discardActiveResult();
    std::string sql = interpolate(statement.sql, statement.params);

    std::unique_ptr<QueryWatchdog> watchdog;
    if (deadline) {
        if (Clock::now() >= *deadline) {
            throw TimeoutError("MySQL statement deadline exceeded before execution");
        }
        watchdog = std::make_unique<QueryWatchdog>(m_config, mysql_thread_id(m_conn), *deadline);
    }

    auto raise = [&]() {
        MySQLException error(m_conn);
        bool timedOut = watchdog && watchdog->fired();
        watchdog.reset();
        if (timedOut) {
            throw TimeoutError("MySQL statement interrupted: deadline exceeded");
        }
        throw error;
    };

    if (mysql_real_query(m_conn, sql.c_str(), sql.size()) != 0) {
        raise();
    }

    QueryResult out;
    int status = 0;
    do {
        MySQLResultSet result(mysql_store_result(m_conn));
        if (result) {
            out = QueryResult{};
            out.columns = result.columns();
            while (MYSQL_ROW row = result.fetchRow()) {
                out.rows.push_back(result.readRow(row, out.columns));
            }
            out.statusTag = "SELECT " + std::to_string(out.rows.size());
        } else if (mysql_field_count(m_conn) == 0) {
            out = QueryResult{};
            out.columns = std::make_shared<std::vector<std::string>>();
            out.rowsAffected = mysql_affected_rows(m_conn);
            std::string keyword = leadingKeyword(sql);
            out.statusTag = keyword + " " + std::to_string(out.rowsAffected);
        } else {
            raise();
        }

        status = mysql_next_result(m_conn);
        if (status > 0) {
            raise();
        }
    } while (status == 0);

    return out;
}

std::unique_ptr<DbCursor> MySQLConnection::openCursor(const CompiledStatement& statement) {
    if (!m_conn) {
        throw InterfaceError("MySQL connection is closed");
    }

    discardActiveResult();
    query(interpolate(statement.sql, statement.params));

    MYSQL_RES* res = mysql_use_result(m_conn);
    if (!res) {
        if (mysql_field_count(m_conn) != 0) {
            throw MySQLException(m_conn);
        }
        // Statement without rows: an already exhausted cursor
        discardActiveResult();
        return std::make_unique<MySQLCursor>(this, std::weak_ptr<MySQLResultSet>());
    }

    m_activeResult = std::make_shared<MySQLResultSet>(res);
    return std::make_unique<MySQLCursor>(this, m_activeResult);
}

std::unique_ptr<DbPreparedStatement> MySQLConnection::prepareStatement(const std::string& sql) {
    if (!m_conn) {
        throw InterfaceError("MySQL connection is closed");
    }

    discardActiveResult();
    MYSQL_STMT* stmt = mysql_stmt_init(m_conn);
    if (!stmt) {
        throw MySQLException(m_conn);
    }
    if (mysql_stmt_prepare(stmt, sql.c_str(), sql.size()) != 0) {
        MySQLException error = statementError(stmt);
        mysql_stmt_close(stmt);
        throw error;
    }
    return std::make_unique<MySQLPreparedStatement>(this, stmt, sql);
}

void MySQLConnection::discardActiveResult() {
    if (!m_conn) return;

    bool hadResult = m_activeResult != nullptr;
    m_activeResult.reset();

    // Remaining result sets of a multi-statement query
    while (mysql_more_results(m_conn) && mysql_next_result(m_conn) == 0) {
        MYSQL_RES* res = mysql_store_result(m_conn);
        if (res) {
            mysql_free_result(res);
        }
    }

    if (hadResult) {
        spdlog::debug("Discarded open MySQL cursor result");
    }
}

// ============================================================================
// Connection State
// ============================================================================

bool MySQLConnection::inTransaction() const {
    return m_conn && (m_conn->server_status & SERVER_STATUS_IN_TRANS) != 0;
}

bool MySQLConnection::ping() {
    if (!m_conn) return false;
    discardActiveResult();
    return mysql_ping(m_conn) == 0;
}

void MySQLConnection::reset() {
    discardActiveResult();
    DbConnection::reset();
}

// ============================================================================
// Error and Status Information
// ============================================================================

const char* MySQLConnection::error() const {
    if (!m_conn) return "No connection";
    return mysql_error(m_conn);
}

unsigned int MySQLConnection::errorNumber() const {
    if (!m_conn) return 0;
    return mysql_errno(m_conn);
}

uint64_t MySQLConnection::affectedRows() const {
    if (!m_conn) return 0;
    return mysql_affected_rows(m_conn);
}

uint64_t MySQLConnection::insertId() const {
    if (!m_conn) return 0;
    return mysql_insert_id(m_conn);
}

// ============================================================================
// MySQLCursor
// ============================================================================

MySQLCursor::MySQLCursor(MySQLConnection* conn, std::weak_ptr<MySQLResultSet> result)
    : m_conn(conn), m_result(std::move(result)) {
    if (auto active = m_result.lock()) {
        m_columns = active->columns();
    } else {
        m_done = true;
    }
}

std::optional<Row> MySQLCursor::fetchOne() {
    if (m_done) return std::nullopt;

    auto result = m_result.lock();
    if (!result) {
        throw InterfaceError("Cursor was invalidated by another statement on its connection");
    }

    MYSQL_ROW row = result->fetchRow();
    if (!row) {
        if (mysql_errno(m_conn->get()) != 0) {
            throw MySQLException(m_conn->get());
        }
        m_done = true;
        result.reset();
        m_conn->discardActiveResult();
        return std::nullopt;
    }
    return result->readRow(row, m_columns);
}

void MySQLCursor::close() {
    if (m_done && m_result.expired()) return;
    m_done = true;
    if (!m_result.expired()) {
        m_conn->discardActiveResult();
    }
}

// ============================================================================
// MySQLPreparedStatement
// ============================================================================

MySQLPreparedStatement::MySQLPreparedStatement(MySQLConnection* conn, MYSQL_STMT* stmt, std::string sql)
    : m_conn(conn), m_stmt(stmt), m_sql(std::move(sql)) {}

MySQLPreparedStatement::~MySQLPreparedStatement() {
    if (m_stmt) {
        mysql_stmt_close(m_stmt);
    }
}

void MySQLPreparedStatement::bindParams(const std::vector<Value>& params) {
    unsigned long expected = mysql_stmt_param_count(m_stmt);
    if (expected != params.size()) {
        throw InterfaceError("Statement expects " + std::to_string(expected) +
                             " parameters but " + std::to_string(params.size()) + " were given");
    }
    if (params.empty()) {
        return;
    }

    size_t count = params.size();
    m_binds.assign(count, MYSQL_BIND{});
    m_integers.assign(count, 0);
    m_reals.assign(count, 0.0);
    m_texts.assign(count, std::string());
    m_lengths.assign(count, 0);

    for (size_t i = 0; i < count; ++i) {
        const Value& param = params[i];
        MYSQL_BIND& bind = m_binds[i];
        switch (param.type()) {
            case Value::Type::Null:
                bind.buffer_type = MYSQL_TYPE_NULL;
                break;
            case Value::Type::Integer:
                m_integers[i] = param.asInt();
                bind.buffer_type = MYSQL_TYPE_LONGLONG;
                bind.buffer = &m_integers[i];
                break;
            case Value::Type::Real:
                m_reals[i] = param.asDouble();
                bind.buffer_type = MYSQL_TYPE_DOUBLE;
                bind.buffer = &m_reals[i];
                break;
            case Value::Type::Text:
            case Value::Type::Blob: {
                if (param.type() == Value::Type::Blob) {
                    Blob blob = param.asBlob();
                    m_texts[i].assign(blob.begin(), blob.end());
                    bind.buffer_type = MYSQL_TYPE_BLOB;
                } else {
                    m_texts[i] = param.asString();
                    bind.buffer_type = MYSQL_TYPE_STRING;
                }
                m_lengths[i] = m_texts[i].size();
                bind.buffer = &m_texts[i][0];
                bind.buffer_length = m_lengths[i];
                bind.length = &m_lengths[i];
                break;
            }
        }
    }

    if (mysql_stmt_bind_param(m_stmt, m_binds.data())) {
        throw statementError(m_stmt);
    }
}

QueryResult MySQLPreparedStatement::execute(const std::vector<Value>& params, Deadline deadline) {
    if (!m_stmt) {
        throw InterfaceError("Prepared statement is closed");
    }

    m_conn->discardActiveResult();
    bindParams(params);

    std::unique_ptr<QueryWatchdog> watchdog;
    if (deadline) {
        if (Clock::now() >= *deadline) {
            throw TimeoutError("MySQL statement deadline exceeded before execution");
        }
        watchdog = std::make_unique<QueryWatchdog>(m_conn->config(), mysql_thread_id(m_conn->get()),
                                                   *deadline);
    }

    try {
        if (mysql_stmt_execute(m_stmt) != 0) {
            throw statementError(m_stmt);
        }
        return fetchResult();
    } catch (const MySQLException&) {
        bool timedOut = watchdog && watchdog->fired();
        watchdog.reset();
        if (timedOut) {
            throw TimeoutError("MySQL statement interrupted: deadline exceeded");
        }
        throw;
    }
}

QueryResult MySQLPreparedStatement::fetchResult() {
    QueryResult out;
    MySQLResultSet metadata(mysql_stmt_result_metadata(m_stmt));
    if (!metadata) {
        if (mysql_stmt_field_count(m_stmt) != 0) {
            throw statementError(m_stmt);
        }
        out.columns = std::make_shared<std::vector<std::string>>();
        out.rowsAffected = mysql_stmt_affected_rows(m_stmt);
        out.statusTag = leadingKeyword(m_sql) + " " + std::to_string(out.rowsAffected);
        return out;
    }

    if (mysql_stmt_store_result(m_stmt) != 0) {
        throw statementError(m_stmt);
    }

    struct FreeGuard {
        MYSQL_STMT* stmt;
        ~FreeGuard() { mysql_stmt_free_result(stmt); }
    } guard{m_stmt};

    out.columns = metadata.columns();
    unsigned int count = metadata.numFields();
    MYSQL_FIELD* fields = metadata.fetchFields();

    // Zero-sized buffers: fetch reports lengths, columns are read one by one
    std::vector<MYSQL_BIND> results(count, MYSQL_BIND{});
    std::vector<unsigned long> lengths(count, 0);
    std::vector<NullFlag> nulls(count, 0);
    for (unsigned int i = 0; i < count; ++i) {
        results[i].buffer_type = MYSQL_TYPE_STRING;
        results[i].length = &lengths[i];
        results[i].is_null = &nulls[i];
    }
    if (count > 0 && mysql_stmt_bind_result(m_stmt, results.data())) {
        throw statementError(m_stmt);
    }

    while (true) {
        int rc = mysql_stmt_fetch(m_stmt);
        if (rc == MYSQL_NO_DATA) {
            break;
        }
        if (rc == 1) {
            throw statementError(m_stmt);
        }

        std::vector<Value> values;
        values.reserve(count);
        for (unsigned int i = 0; i < count; ++i) {
            if (nulls[i]) {
                values.emplace_back();
                continue;
            }
            std::string data(lengths[i], '\0');
            if (!data.empty()) {
                unsigned long length = 0;
                MYSQL_BIND column{};
                column.buffer_type = MYSQL_TYPE_STRING;
                column.buffer = &data[0];
                column.buffer_length = data.size();
                column.length = &length;
                if (mysql_stmt_fetch_column(m_stmt, &column, i, 0) != 0) {
                    throw statementError(m_stmt);
                }
            }
            values.push_back(MySQLResultSet::convert(fields[i], data.data(), data.size()));
        }
        out.rows.emplace_back(out.columns, std::move(values));
    }

    out.statusTag = "SELECT " + std::to_string(out.rows.size());
    return out;
}

std::unique_ptr<DbCursor> MySQLPreparedStatement::openCursor(const std::vector<Value>& params) {
    return m_conn->openCursor(CompiledStatement{m_sql, params});
}

void MySQLPreparedStatement::close() {
    if (!m_stmt) {
        return;
    }
    MYSQL_STMT* stmt = m_stmt;
    m_stmt = nullptr;
    if (mysql_stmt_close(stmt)) {
        throw MySQLException(m_conn->get());
    }
}

}  // namespace sqlctx
