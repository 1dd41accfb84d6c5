/**
 * @file SQLiteConnection.cpp
 * @brief Implementation of the SQLite DbConnection.
 */

#include "SQLiteConnection.hpp"
#include "SQLiteResultSet.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace sqlctx {

namespace {

// Instructions between two deadline checks
constexpr int kProgressInterval = 1000;

// Skip whitespace, comments and empty statements in front of a statement
size_t statementStart(const std::string& sql) {
    size_t pos = 0;
    while (pos < sql.size()) {
        if (std::isspace(static_cast<unsigned char>(sql[pos])) || sql[pos] == ';') {
            ++pos;
        } else if (sql.compare(pos, 2, "--") == 0) {
            size_t end = sql.find('\n', pos);
            pos = (end == std::string::npos) ? sql.size() : end + 1;
        } else if (sql.compare(pos, 2, "/*") == 0) {
            size_t end = sql.find("*/", pos + 2);
            pos = (end == std::string::npos) ? sql.size() : end + 2;
        } else {
            break;
        }
    }
    return pos;
}

bool hasMoreStatements(const char* tail) {
    std::string rest = tail ? tail : "";
    return statementStart(rest) < rest.size();
}

// First keyword of a statement, upper-cased
std::string leadingKeyword(const std::string& sql) {
    size_t start = statementStart(sql);
    size_t end = start;
    while (end < sql.size() && std::isalpha(static_cast<unsigned char>(sql[end]))) {
        ++end;
    }
    std::string keyword = sql.substr(start, end - start);
    std::transform(keyword.begin(), keyword.end(), keyword.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return keyword;
}

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteConnection::SQLiteConnection(const std::string& dbPath, std::chrono::milliseconds busyTimeout)
    : m_path(dbPath) {
    int rc = sqlite3_open_v2(dbPath.c_str(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string message = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
        spdlog::error("Failed to open SQLite database '{}': {}", dbPath, message);
        if (m_db) {
            sqlite3_close_v2(m_db);
            m_db = nullptr;
        }
        throw SQLiteException(rc, message);
    }

    sqlite3_extended_result_codes(m_db, 1);
    sqlite3_busy_timeout(m_db, static_cast<int>(busyTimeout.count()));
    spdlog::debug("Opened SQLite database '{}'", dbPath);
}

SQLiteConnection::~SQLiteConnection() {
    if (m_db) {
        sqlite3_close_v2(m_db);
    }
}

// ============================================================================
// Query Execution
// ============================================================================

QueryResult SQLiteConnection::execute(const CompiledStatement& statement, Deadline deadline) {
    if (!m_db) {
        throw InterfaceError("SQLite connection is closed");
    }

    const std::vector<Value>& params = statement.params;
    const char* sql = statement.sql.c_str();
    size_t bound = 0;
    std::optional<QueryResult> last;

    while (*sql) {
        const char* tail = nullptr;
        SQLiteResultSet result = prepareOne(sql, &tail);
        sql = tail;
        if (!result) {
            continue;
        }

        // Each statement numbers its own placeholders from 1
        size_t count = static_cast<size_t>(sqlite3_bind_parameter_count(result.get()));
        if (bound + count > params.size()) {
            throw InterfaceError("Statement expects more than " + std::to_string(params.size()) +
                                 " parameters");
        }
        result.bind(std::vector<Value>(params.begin() + bound, params.begin() + bound + count));
        bound += count;

        last = run(result, deadline);
    }

    if (!last) {
        throw InterfaceError("Empty SQL statement");
    }
    if (bound != params.size()) {
        throw InterfaceError("Statement expects " + std::to_string(bound) +
                             " parameters but " + std::to_string(params.size()) + " were given");
    }
    return std::move(*last);
}

QueryResult SQLiteConnection::run(SQLiteResultSet& result, Deadline deadline) {
    m_deadline = deadline;
    if (deadline) {
        sqlite3_progress_handler(m_db, kProgressInterval, &SQLiteConnection::progressHandler, this);
    }

    struct HandlerGuard {
        SQLiteConnection* self;
        ~HandlerGuard() {
            if (self->m_deadline) {
                sqlite3_progress_handler(self->m_db, 0, nullptr, nullptr);
                self->m_deadline.reset();
            }
        }
    } guard{this};

    QueryResult out;
    out.columns = result.columns();
    while (result.step()) {
        out.rows.push_back(result.readRow(out.columns));
    }

    if (result.columnCount() > 0) {
        out.statusTag = "SELECT " + std::to_string(out.rows.size());
        out.rowsAffected = result.isReadOnly() ? 0 : static_cast<uint64_t>(changes());
    } else {
        std::string keyword = leadingKeyword(sqlite3_sql(result.get()));
        bool dml = keyword == "INSERT" || keyword == "UPDATE" || keyword == "DELETE" ||
                   keyword == "REPLACE";
        out.rowsAffected = dml ? static_cast<uint64_t>(changes()) : 0;
        out.statusTag = dml ? keyword + " " + std::to_string(out.rowsAffected) : keyword;
    }
    return out;
}

std::unique_ptr<DbCursor> SQLiteConnection::openCursor(const CompiledStatement& statement) {
    if (!m_db) {
        throw InterfaceError("SQLite connection is closed");
    }
    const char* tail = nullptr;
    SQLiteResultSet result = prepareOne(statement.sql.c_str(), &tail);
    if (!result) {
        throw InterfaceError("Empty SQL statement");
    }
    if (hasMoreStatements(tail)) {
        throw InterfaceError("A cursor runs a single SQL statement");
    }
    result.bind(statement.params);
    return std::make_unique<SQLiteCursor>(std::move(result));
}

std::unique_ptr<DbPreparedStatement> SQLiteConnection::prepareStatement(const std::string& sql) {
    if (!m_db) {
        throw InterfaceError("SQLite connection is closed");
    }
    const char* tail = nullptr;
    SQLiteResultSet result = prepareOne(sql.c_str(), &tail);
    if (!result) {
        throw InterfaceError("Empty SQL statement");
    }
    if (hasMoreStatements(tail)) {
        throw InterfaceError("A prepared statement holds a single SQL statement");
    }
    return std::make_unique<SQLitePreparedStatement>(*this, std::move(result));
}

SQLiteResultSet SQLiteConnection::prepareOne(const char* sql, const char** tail) {
    // Compile SQL into a prepared statement for execution
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql, -1, &stmt, tail);
    if (rc != SQLITE_OK) {
        spdlog::debug("SQLite prepare failed: {}", sqlite3_errmsg(m_db));
        throw SQLiteException(sqlite3_extended_errcode(m_db), sqlite3_errmsg(m_db));
    }
    return SQLiteResultSet(stmt);
}

int SQLiteConnection::progressHandler(void* data) {
    auto* self = static_cast<SQLiteConnection*>(data);
    // Non-zero interrupts the running statement with SQLITE_INTERRUPT
    return self->m_deadline && Clock::now() >= *self->m_deadline ? 1 : 0;
}

// ============================================================================
// State
// ============================================================================

bool SQLiteConnection::inTransaction() const {
    return m_db && sqlite3_get_autocommit(m_db) == 0;
}

bool SQLiteConnection::ping() {
    if (!m_db) return false;
    int rc = sqlite3_exec(m_db, "SELECT 1", nullptr, nullptr, nullptr);
    return rc == SQLITE_OK;
}

// ============================================================================
// Error and Status Information
// ============================================================================

const char* SQLiteConnection::error() const {
    return m_db ? sqlite3_errmsg(m_db) : "no connection";
}

int SQLiteConnection::errorCode() const {
    return m_db ? sqlite3_errcode(m_db) : SQLITE_ERROR;
}

int64_t SQLiteConnection::lastInsertRowId() const {
    return m_db ? sqlite3_last_insert_rowid(m_db) : 0;
}

int SQLiteConnection::changes() const {
    return m_db ? sqlite3_changes(m_db) : 0;
}

}  // namespace sqlctx
