/**
 * @file SQLiteResultSet.cpp
 * @brief Implementation of the RAII SQLite statement wrapper and cursor.
 */

#include "SQLiteResultSet.hpp"
#include "SQLiteConnection.hpp"
#include "Errors.hpp"

namespace sqlctx {

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteResultSet::SQLiteResultSet(sqlite3_stmt* stmt) : m_stmt(stmt) {}

SQLiteResultSet::~SQLiteResultSet() {
    finalize();
}

// ============================================================================
// Move Operations
// ============================================================================

SQLiteResultSet::SQLiteResultSet(SQLiteResultSet&& other) noexcept
    : m_stmt(other.m_stmt) {
    other.m_stmt = nullptr;
}

SQLiteResultSet& SQLiteResultSet::operator=(SQLiteResultSet&& other) noexcept {
    if (this != &other) {
        finalize();
        m_stmt = other.m_stmt;
        other.m_stmt = nullptr;
    }
    return *this;
}

// ============================================================================
// Binding
// ============================================================================

void SQLiteResultSet::bind(const std::vector<Value>& params) {
    if (!m_stmt) {
        throw InterfaceError("Statement is finalized");
    }

    int expected = sqlite3_bind_parameter_count(m_stmt);
    if (expected != static_cast<int>(params.size())) {
        throw InterfaceError("Statement expects " + std::to_string(expected) +
                             " parameters but " + std::to_string(params.size()) + " were given");
    }

    for (size_t i = 0; i < params.size(); ++i) {
        const Value& param = params[i];
        int index = static_cast<int>(i) + 1;
        int rc = SQLITE_OK;

        switch (param.type()) {
            case Value::Type::Null:
                rc = sqlite3_bind_null(m_stmt, index);
                break;
            case Value::Type::Integer:
                rc = sqlite3_bind_int64(m_stmt, index, param.asInt());
                break;
            case Value::Type::Real:
                rc = sqlite3_bind_double(m_stmt, index, param.asDouble());
                break;
            case Value::Type::Text: {
                std::string text = param.asString();
                rc = sqlite3_bind_text(m_stmt, index, text.data(), static_cast<int>(text.size()),
                                       SQLITE_TRANSIENT);
                break;
            }
            case Value::Type::Blob: {
                Blob blob = param.asBlob();
                rc = sqlite3_bind_blob(m_stmt, index, blob.data(), static_cast<int>(blob.size()),
                                       SQLITE_TRANSIENT);
                break;
            }
        }

        if (rc != SQLITE_OK) {
            raise(rc);
        }
    }
}

// ============================================================================
// Row Iteration
// ============================================================================

bool SQLiteResultSet::step() {
    if (!m_stmt) return false;

    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    raise(rc);
}

// ============================================================================
// Column Access
// ============================================================================

int SQLiteResultSet::columnCount() const {
    return m_stmt ? sqlite3_column_count(m_stmt) : 0;
}

std::string SQLiteResultSet::columnName(int index) const {
    if (!m_stmt) return "";
    const char* name = sqlite3_column_name(m_stmt, index);
    return name ? name : "";
}

Row::Columns SQLiteResultSet::columns() const {
    auto names = std::make_shared<std::vector<std::string>>();
    int count = columnCount();
    names->reserve(count);
    for (int i = 0; i < count; ++i) {
        names->push_back(columnName(i));
    }
    return names;
}

Value SQLiteResultSet::value(int index) const {
    if (!m_stmt) return Value();

    switch (sqlite3_column_type(m_stmt, index)) {
        case SQLITE_INTEGER:
            return Value(static_cast<int64_t>(sqlite3_column_int64(m_stmt, index)));
        case SQLITE_FLOAT:
            return Value(sqlite3_column_double(m_stmt, index));
        case SQLITE_TEXT: {
            const unsigned char* text = sqlite3_column_text(m_stmt, index);
            int size = sqlite3_column_bytes(m_stmt, index);
            return Value(std::string(reinterpret_cast<const char*>(text), size));
        }
        case SQLITE_BLOB: {
            const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(m_stmt, index));
            int size = sqlite3_column_bytes(m_stmt, index);
            return Value(Blob(data, data + size));
        }
        default:
            return Value();
    }
}

Row SQLiteResultSet::readRow(const Row::Columns& columns) const {
    std::vector<Value> values;
    int count = columnCount();
    values.reserve(count);
    for (int i = 0; i < count; ++i) {
        values.push_back(value(i));
    }
    return Row(columns, std::move(values));
}

bool SQLiteResultSet::isReadOnly() const {
    return m_stmt && sqlite3_stmt_readonly(m_stmt) != 0;
}

// ============================================================================
// Statement Management
// ============================================================================

void SQLiteResultSet::reset() {
    if (m_stmt) {
        // Repeats the error of the last step, which step() already raised
        sqlite3_reset(m_stmt);
        sqlite3_clear_bindings(m_stmt);
    }
}

void SQLiteResultSet::finalize() {
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
    }
}

void SQLiteResultSet::raise(int rc) const {
    sqlite3* db = m_stmt ? sqlite3_db_handle(m_stmt) : nullptr;
    if (rc == SQLITE_INTERRUPT) {
        throw TimeoutError("SQLite statement interrupted: deadline exceeded");
    }
    throw SQLiteException(db ? sqlite3_extended_errcode(db) : rc,
                          db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
}

// ============================================================================
// SQLiteCursor
// ============================================================================

SQLiteCursor::SQLiteCursor(SQLiteResultSet result)
    : m_result(std::move(result)),
      m_columns(m_result.columns()) {}

std::optional<Row> SQLiteCursor::fetchOne() {
    if (m_done || !m_result) {
        return std::nullopt;
    }
    if (!m_result.step()) {
        m_done = true;
        return std::nullopt;
    }
    return m_result.readRow(m_columns);
}

void SQLiteCursor::close() {
    m_done = true;
    m_result.finalize();
}

// ============================================================================
// SQLitePreparedStatement
// ============================================================================

SQLitePreparedStatement::SQLitePreparedStatement(SQLiteConnection& connection, SQLiteResultSet statement)
    : m_connection(connection),
      m_statement(std::move(statement)) {}

QueryResult SQLitePreparedStatement::execute(const std::vector<Value>& params, Deadline deadline) {
    if (!m_statement) {
        throw InterfaceError("Prepared statement is closed");
    }

    // Rewound after every execution, failed ones included
    struct ResetGuard {
        SQLiteResultSet& statement;
        ~ResetGuard() { statement.reset(); }
    } guard{m_statement};

    m_statement.reset();
    m_statement.bind(params);
    return m_connection.run(m_statement, deadline);
}

std::unique_ptr<DbCursor> SQLitePreparedStatement::openCursor(const std::vector<Value>& params) {
    if (!m_statement) {
        throw InterfaceError("Prepared statement is closed");
    }
    const char* tail = nullptr;
    SQLiteResultSet copy = m_connection.prepareOne(sqlite3_sql(m_statement.get()), &tail);
    copy.bind(params);
    return std::make_unique<SQLiteCursor>(std::move(copy));
}

void SQLitePreparedStatement::close() {
    m_statement.finalize();
}

}  // namespace sqlctx
