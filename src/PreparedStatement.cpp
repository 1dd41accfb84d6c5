#include "PreparedStatement.hpp"
#include "Connection.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <exception>

namespace sqlctx {

PreparedStatement::PreparedStatement(std::shared_ptr<Connection> connection, Query query,
                                     StatementTemplate layout, uint64_t id, uint64_t generation)
    : m_connection(std::move(connection)),
      m_query(std::move(query)),
      m_layout(std::move(layout)),
      m_id(id),
      m_generation(generation),
      m_options(m_connection->effectiveOptions(m_query)),
      m_loader(resolveLoader(m_options)) {}

PreparedStatement::~PreparedStatement() {
    closeQuietly();
}

PreparedStatement::PreparedStatement(PreparedStatement&& other) noexcept
    : m_connection(std::move(other.m_connection)),
      m_query(std::move(other.m_query)),
      m_layout(std::move(other.m_layout)),
      m_id(other.m_id),
      m_generation(other.m_generation),
      m_options(std::move(other.m_options)),
      m_loader(std::move(other.m_loader)) {}

PreparedStatement& PreparedStatement::operator=(PreparedStatement&& other) noexcept {
    if (this != &other) {
        closeQuietly();
        m_connection = std::move(other.m_connection);
        m_query = std::move(other.m_query);
        m_layout = std::move(other.m_layout);
        m_id = other.m_id;
        m_generation = other.m_generation;
        m_options = std::move(other.m_options);
        m_loader = std::move(other.m_loader);
    }
    return *this;
}

template <typename Fn>
auto PreparedStatement::withStatement(Deadline deadline, Fn&& fn)
    -> decltype(fn(std::declval<DbConnection&>(), std::declval<DbPreparedStatement&>())) {
    if (!m_connection) {
        throw InterfaceError("The prepared statement is closed");
    }
    auto lease = m_connection->leaseRaw(m_connection->acquireDeadline(deadline), false);
    if (!lease.raw || lease.generation != m_generation) {
        throw InterfaceError("The connection of this prepared statement was released");
    }
    DbPreparedStatement* statement = lease.raw->prepared(m_id);
    if (!statement) {
        throw InterfaceError("The prepared statement is closed");
    }
    return fn(*lease.raw, *statement);
}

std::vector<Value> PreparedStatement::bind(const Params& params) const {
    return m_layout.bind(params.empty() ? m_query.params() : params);
}

// ============================================================================
// Queries
// ============================================================================

QueryResult PreparedStatement::execute(const Params& params) {
    std::vector<Value> values = bind(params);

    Deadline deadline;
    if (m_options.timeout) {
        deadline = Clock::now() + *m_options.timeout;
    }
    return withStatement(deadline, [&](DbConnection&, DbPreparedStatement& statement) {
        return statement.execute(values, deadline);
    });
}

std::vector<Row> PreparedStatement::all(const Params& params) {
    return execute(params).rows;
}

std::optional<Row> PreparedStatement::first(const Params& params) {
    auto rows = execute(params).rows;
    if (rows.empty()) {
        return std::nullopt;
    }
    return std::move(rows.front());
}

Row PreparedStatement::one(const Params& params) {
    auto rows = execute(params).rows;
    if (rows.empty()) {
        throw NoResultError();
    }
    if (rows.size() > 1) {
        throw MultipleResultsError();
    }
    return std::move(rows.front());
}

std::optional<Row> PreparedStatement::oneOrNone(const Params& params) {
    auto rows = execute(params).rows;
    if (rows.size() > 1) {
        throw MultipleResultsError();
    }
    if (rows.empty()) {
        return std::nullopt;
    }
    return std::move(rows.front());
}

Value PreparedStatement::scalar(const Params& params) {
    auto rows = execute(params).rows;
    if (rows.empty() || rows.front().empty()) {
        return Value();
    }
    return rows.front()[0];
}

QueryResult PreparedStatement::status(const Params& params) {
    return execute(params);
}

Cursor PreparedStatement::iterate(const Params& params) {
    std::vector<Value> values = bind(params);

    auto cursor = withStatement(std::nullopt, [&](DbConnection& raw, DbPreparedStatement& statement) {
        if (!raw.inTransaction()) {
            throw InterfaceError("Cursors can only be used inside a transaction");
        }
        return statement.openCursor(values);
    });
    return Cursor(m_connection, std::move(cursor), m_generation, m_loader);
}

// ============================================================================
// Close
// ============================================================================

void PreparedStatement::close() {
    if (!m_connection) {
        return;
    }
    std::shared_ptr<Connection> connection = std::move(m_connection);

    // Statements of a released connection were closed when it went back to the pool
    if (connection->isClosed()) {
        return;
    }
    auto lease = connection->leaseRaw(connection->acquireDeadline(std::nullopt), false);
    if (lease.raw && lease.generation == m_generation) {
        lease.raw->closePrepared(m_id);
    }
}

void PreparedStatement::closeQuietly() noexcept {
    try {
        close();
    } catch (const std::exception& e) {
        spdlog::warn("Failed to close prepared statement: {}", e.what());
    }
}

}  // namespace sqlctx
