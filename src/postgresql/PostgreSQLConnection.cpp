#include "PostgreSQLConnection.hpp"
#include "Config.hpp"
#include <spdlog/spdlog.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <sstream>

namespace sqlctx {

namespace {

// Text format for everything but blobs, which are sent as binary
struct ParamBuffers {
    explicit ParamBuffers(const std::vector<Value>& params)
        : storage(params.size()),
          values(params.size(), nullptr),
          lengths(params.size(), 0),
          formats(params.size(), 0) {
        blobs.reserve(params.size());
        for (size_t i = 0; i < params.size(); ++i) {
            const Value& param = params[i];
            switch (param.type()) {
                case Value::Type::Null:
                    break;
                case Value::Type::Blob:
                    blobs.push_back(param.asBlob());
                    values[i] = reinterpret_cast<const char*>(blobs.back().data());
                    lengths[i] = static_cast<int>(blobs.back().size());
                    formats[i] = 1;
                    break;
                default:
                    storage[i] = param.asString();
                    values[i] = storage[i].c_str();
                    break;
            }
        }
    }

    int count() const { return static_cast<int>(values.size()); }

    std::vector<std::string> storage;
    std::vector<const char*> values;
    std::vector<int> lengths;
    std::vector<int> formats;
    std::vector<Blob> blobs;
};

// Single-quote a connection string value
std::string quoteValue(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    quoted += '\'';
    return quoted;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

std::string PostgreSQLConnection::connectionString(const ConnectionConfig& config) {
    std::ostringstream connInfo;

    if (!config.socket.empty()) {
        connInfo << "host=" << quoteValue(config.socket);
    } else {
        connInfo << "host=" << quoteValue(config.host);
    }
    connInfo << " port=" << (config.port ? config.port : 5432);

    if (!config.user.empty()) {
        connInfo << " user=" << quoteValue(config.user);
    }

    if (!config.password.empty()) {
        connInfo << " password=" << quoteValue(config.password);
    }

    if (!config.database.empty()) {
        connInfo << " dbname=" << quoteValue(config.database);
    }

    // Timeout in seconds, at least one since 0 means wait forever
    connInfo << " connect_timeout=" << std::max<long long>(1, config.connect_timeout.count() / 1000);

    // SSL options
    if (config.use_ssl) {
        connInfo << " sslmode=require";
        if (!config.ssl_ca.empty()) {
            connInfo << " sslrootcert=" << quoteValue(config.ssl_ca);
        }
        if (!config.ssl_cert.empty()) {
            connInfo << " sslcert=" << quoteValue(config.ssl_cert);
        }
        if (!config.ssl_key.empty()) {
            connInfo << " sslkey=" << quoteValue(config.ssl_key);
        }
    } else {
        connInfo << " sslmode=prefer";
    }

    // Application name for identification
    connInfo << " application_name="
             << quoteValue(config.application_name.empty() ? "sql-context" : config.application_name);

    return connInfo.str();
}

PostgreSQLConnection::PostgreSQLConnection(const ConnectionConfig& config) {
    m_conn = PQconnectdb(connectionString(config).c_str());

    if (!m_conn) {
        throw PostgreSQLException(CONNECTION_BAD, "Failed to allocate PostgreSQL connection");
    }

    if (PQstatus(m_conn) != CONNECTION_OK) {
        std::string errorMsg = PQerrorMessage(m_conn);
        PQfinish(m_conn);
        m_conn = nullptr;
        throw PostgreSQLException(CONNECTION_BAD, "Failed to connect to PostgreSQL: " + errorMsg);
    }

    // Set client encoding to UTF-8
    PQsetClientEncoding(m_conn, "UTF8");

    spdlog::debug("Connected to PostgreSQL server {}:{}", PQhost(m_conn), PQport(m_conn));
}

PostgreSQLConnection::~PostgreSQLConnection() {
    if (m_conn) {
        PQfinish(m_conn);
    }
}

// ============================================================================
// Query Execution
// ============================================================================

PostgreSQLResultSet PostgreSQLConnection::run(const std::string& sql, const std::vector<Value>& params,
                                              Deadline deadline) {
    if (!m_conn) {
        throw InterfaceError("PostgreSQL connection is closed");
    }

    ParamBuffers buffers(params);
    int sent = PQsendQueryParams(m_conn, sql.c_str(), buffers.count(), nullptr, buffers.values.data(),
                                 buffers.lengths.data(), buffers.formats.data(), 0);
    if (!sent) {
        throw PostgreSQLException(PQstatus(m_conn), error());
    }
    return finish(deadline);
}

PostgreSQLResultSet PostgreSQLConnection::runPrepared(const std::string& name,
                                                      const std::vector<Value>& params,
                                                      Deadline deadline) {
    if (!m_conn) {
        throw InterfaceError("PostgreSQL connection is closed");
    }

    ParamBuffers buffers(params);
    int sent = PQsendQueryPrepared(m_conn, name.c_str(), buffers.count(), buffers.values.data(),
                                   buffers.lengths.data(), buffers.formats.data(), 0);
    if (!sent) {
        throw PostgreSQLException(PQstatus(m_conn), error());
    }
    return finish(deadline);
}

PostgreSQLResultSet PostgreSQLConnection::finish(Deadline deadline) {
    bool timedOut = !waitForResult(deadline);
    if (timedOut) {
        cancelRunning();
    }

    // Keep the last result, like PQexec does for multi-statement strings
    PostgreSQLResultSet result;
    while (PGresult* res = PQgetResult(m_conn)) {
        result.reset(res);
    }

    if (timedOut) {
        throw TimeoutError("PostgreSQL statement cancelled: deadline exceeded");
    }
    if (!result.get()) {
        throw PostgreSQLException(PQstatus(m_conn), error());
    }
    if (!result.isOk()) {
        throw PostgreSQLException(result.status(), result.errorMessage(), result.sqlState());
    }
    return result;
}

QueryResult PostgreSQLConnection::execute(const CompiledStatement& statement, Deadline deadline) {
    return buffer(run(statement.sql, statement.params, deadline));
}

QueryResult PostgreSQLConnection::buffer(const PostgreSQLResultSet& result) {
    QueryResult out;
    out.columns = result.columns();
    out.statusTag = result.commandStatus();
    out.rowsAffected = result.affectedRows();

    int rows = result.numRows();
    out.rows.reserve(rows);
    for (int i = 0; i < rows; ++i) {
        out.rows.push_back(result.readRow(i, out.columns));
    }
    return out;
}

std::unique_ptr<DbCursor> PostgreSQLConnection::openCursor(const CompiledStatement& statement) {
    std::string name = "sqlctx_cur_" + std::to_string(++m_cursorCounter);
    run("DECLARE " + name + " NO SCROLL CURSOR FOR " + statement.sql, statement.params);
    return std::make_unique<PostgreSQLCursor>(this, name);
}

std::unique_ptr<DbPreparedStatement> PostgreSQLConnection::prepareStatement(const std::string& sql) {
    if (!m_conn) {
        throw InterfaceError("PostgreSQL connection is closed");
    }

    std::string name = "sqlctx_stmt_" + std::to_string(++m_statementCounter);
    if (!PQsendPrepare(m_conn, name.c_str(), sql.c_str(), 0, nullptr)) {
        throw PostgreSQLException(PQstatus(m_conn), error());
    }
    finish(std::nullopt);
    spdlog::debug("Prepared PostgreSQL statement {}", name);
    return std::make_unique<PostgreSQLPreparedStatement>(this, std::move(name), sql);
}

bool PostgreSQLConnection::waitForResult(Deadline deadline) {
    int socket = PQsocket(m_conn);

    while (true) {
        if (!PQconsumeInput(m_conn)) {
            // Connection trouble, PQgetResult will report it
            return true;
        }
        if (!PQisBusy(m_conn)) {
            return true;
        }

        int waitMs = -1;
        if (deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now());
            if (remaining.count() <= 0) {
                return false;
            }
            waitMs = static_cast<int>(remaining.count());
        }

        pollfd fd{};
        fd.fd = socket;
        fd.events = POLLIN;
        int rc = poll(&fd, 1, waitMs);
        if (rc < 0 && errno != EINTR) {
            return true;
        }
    }
}

void PostgreSQLConnection::cancelRunning() {
    PGcancel* cancel = PQgetCancel(m_conn);
    if (!cancel) return;

    char errbuf[256] = {};
    if (!PQcancel(cancel, errbuf, sizeof(errbuf))) {
        spdlog::warn("Failed to cancel PostgreSQL query: {}", errbuf);
    }
    PQfreeCancel(cancel);
}

// ============================================================================
// State
// ============================================================================

bool PostgreSQLConnection::inTransaction() const {
    if (!m_conn) return false;
    PGTransactionStatusType status = PQtransactionStatus(m_conn);
    return status == PQTRANS_INTRANS || status == PQTRANS_INERROR || status == PQTRANS_ACTIVE;
}

bool PostgreSQLConnection::isValid() const {
    return m_conn != nullptr && PQstatus(m_conn) == CONNECTION_OK;
}

bool PostgreSQLConnection::ping() {
    if (!m_conn) return false;

    // Try a simple query to check connection
    PGresult* res = PQexec(m_conn, "SELECT 1");
    bool ok = res && PQresultStatus(res) == PGRES_TUPLES_OK;
    if (res) PQclear(res);
    return ok;
}

const char* PostgreSQLConnection::error() const {
    if (!m_conn) return "No connection";
    return PQerrorMessage(m_conn);
}

std::string PostgreSQLConnection::escapeIdentifier(const std::string& identifier) const {
    if (!m_conn) return "\"" + identifier + "\"";

    char* escaped = PQescapeIdentifier(m_conn, identifier.c_str(), identifier.size());
    if (!escaped) return "\"" + identifier + "\"";

    std::string result(escaped);
    PQfreemem(escaped);
    return result;
}

// ============================================================================
// PostgreSQLCursor
// ============================================================================

PostgreSQLCursor::PostgreSQLCursor(PostgreSQLConnection* conn, std::string name)
    : m_conn(conn), m_name(std::move(name)) {}

bool PostgreSQLCursor::fill(size_t count) {
    if (m_exhausted || m_closed) return false;

    PostgreSQLResultSet result = m_conn->run("FETCH " + std::to_string(count) + " FROM " + m_name, {});
    auto columns = result.columns();
    int rows = result.numRows();
    for (int i = 0; i < rows; ++i) {
        m_buffer.push_back(result.readRow(i, columns));
    }
    if (static_cast<size_t>(rows) < count) {
        m_exhausted = true;
    }
    return rows > 0;
}

std::optional<Row> PostgreSQLCursor::fetchOne() {
    if (m_buffer.empty() && !fill(kFetchSize)) {
        return std::nullopt;
    }
    if (m_buffer.empty()) {
        return std::nullopt;
    }
    Row row = std::move(m_buffer.front());
    m_buffer.pop_front();
    return row;
}

std::vector<Row> PostgreSQLCursor::fetchMany(size_t count) {
    if (m_buffer.size() < count) {
        fill(std::max(count - m_buffer.size(), kFetchSize));
    }
    std::vector<Row> rows;
    while (rows.size() < count && !m_buffer.empty()) {
        rows.push_back(std::move(m_buffer.front()));
        m_buffer.pop_front();
    }
    return rows;
}

size_t PostgreSQLCursor::skip(size_t count) {
    size_t skipped = std::min(count, m_buffer.size());
    m_buffer.erase(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(skipped));
    if (skipped == count || m_exhausted || m_closed) {
        return skipped;
    }

    size_t remaining = count - skipped;
    PostgreSQLResultSet result =
        m_conn->run("MOVE FORWARD " + std::to_string(remaining) + " IN " + m_name, {});
    size_t moved = static_cast<size_t>(result.affectedRows());
    if (moved < remaining) {
        m_exhausted = true;
    }
    return skipped + moved;
}

void PostgreSQLCursor::close() {
    if (m_closed) return;
    m_closed = true;
    m_buffer.clear();

    // The server drops cursors when their transaction ends
    if (m_conn->inTransaction() && PQtransactionStatus(m_conn->get()) == PQTRANS_INTRANS) {
        m_conn->run("CLOSE " + m_name, {});
    }
}

// ============================================================================
// PostgreSQLPreparedStatement
// ============================================================================

PostgreSQLPreparedStatement::PostgreSQLPreparedStatement(PostgreSQLConnection* conn, std::string name,
                                                         std::string sql)
    : m_conn(conn), m_name(std::move(name)), m_sql(std::move(sql)) {}

QueryResult PostgreSQLPreparedStatement::execute(const std::vector<Value>& params, Deadline deadline) {
    return PostgreSQLConnection::buffer(m_conn->runPrepared(m_name, params, deadline));
}

std::unique_ptr<DbCursor> PostgreSQLPreparedStatement::openCursor(const std::vector<Value>& params) {
    // DECLARE takes a query text, not a statement name
    return m_conn->openCursor(CompiledStatement{m_sql, params});
}

void PostgreSQLPreparedStatement::close() {
    m_conn->run("DEALLOCATE " + m_name, {});
}

}  // namespace sqlctx
