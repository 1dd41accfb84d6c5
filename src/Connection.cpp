#include "Connection.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <exception>

namespace sqlctx {

// ============================================================================
// Construction and Destruction
// ============================================================================

Connection::Connection(ConnectionPoolPtr pool, DialectPtr dialect, ConnectionPtr root,
                       ExecutionOptions options, std::optional<std::chrono::milliseconds> timeout,
                       bool lazy, CancellationTokenPtr token)
    : m_pool(std::move(pool)),
      m_dialect(std::move(dialect)),
      m_root(std::move(root)),
      m_options(std::move(options)),
      m_timeout(timeout),
      m_lazy(lazy),
      m_token(std::move(token)) {}

ConnectionPtr Connection::createRoot(ConnectionPoolPtr pool,
                                     DialectPtr dialect,
                                     ExecutionOptions options,
                                     std::optional<std::chrono::milliseconds> timeout,
                                     bool lazy,
                                     CancellationTokenPtr token) {
    return ConnectionPtr(new Connection(std::move(pool), std::move(dialect), nullptr,
                                        std::move(options), timeout, lazy, std::move(token)));
}

ConnectionPtr Connection::createReusing(const ConnectionPtr& connection,
                                        ExecutionOptions options,
                                        std::optional<std::chrono::milliseconds> timeout,
                                        bool lazy,
                                        CancellationTokenPtr token) {
    ConnectionPtr root = connection->root();
    return ConnectionPtr(new Connection(root->m_pool, root->m_dialect, root,
                                        std::move(options), timeout, lazy, std::move(token)));
}

Connection::~Connection() {
    // A root dropped without release still owes its connection to the pool
    if (m_raw) {
        m_raw->closeAllPrepared();
        try {
            m_pool->release(std::move(m_raw));
        } catch (const std::exception& e) {
            spdlog::error("Failed to return connection to the pool: {}", e.what());
        }
    }
}

ConnectionPtr Connection::root() {
    return m_root ? m_root : shared_from_this();
}

void Connection::track(const std::shared_ptr<ExecutionContext>& context, ExecutionContext::Key key) {
    m_context = context;
    m_key = key;
    m_tracked = true;
}

// ============================================================================
// Physical connection
// ============================================================================

void Connection::checkOpen() const {
    if (m_closed) {
        throw InterfaceError("The connection is closed");
    }
}

Deadline Connection::acquireDeadline(Deadline operationDeadline) const {
    if (operationDeadline) {
        return operationDeadline;
    }
    auto timeout = m_timeout;
    if (!timeout && m_root) {
        timeout = m_root->m_timeout;
    }
    if (timeout) {
        return Clock::now() + *timeout;
    }
    return std::nullopt;
}

Connection::RawLease Connection::leaseRaw(Deadline deadline, bool materialize) {
    checkOpen();
    Connection& root = m_root ? *m_root : *this;

    RawLease lease;
    lease.lock = std::unique_lock<std::timed_mutex>(root.m_useMutex, std::defer_lock);
    if (deadline) {
        if (!lease.lock.try_lock_until(*deadline)) {
            throw TimeoutError("Timed out waiting for the connection to become available");
        }
    } else {
        lease.lock.lock();
    }

    // Checked under the lock, the root releases its connection holding it too
    if (root.m_closed) {
        throw InterfaceError("The connection reused by this handle was released");
    }

    if (!root.m_raw && materialize) {
        root.m_raw = root.m_pool->acquire(deadline, m_token.get());
        root.m_generation++;
        spdlog::debug("Connection materialized (generation {})", root.m_generation);
    }

    lease.raw = root.m_raw.get();
    lease.generation = root.m_generation;
    return lease;
}

DbConnection* Connection::rawConnection() const {
    const Connection& root = m_root ? *m_root : *this;
    std::lock_guard<std::timed_mutex> lock(root.m_useMutex);
    return root.m_raw.get();
}

DbConnection* Connection::getRawConnection(std::optional<std::chrono::milliseconds> timeout) {
    Deadline deadline = timeout ? Deadline(Clock::now() + *timeout) : acquireDeadline(std::nullopt);
    return leaseRaw(deadline).raw;
}

// ============================================================================
// Release
// ============================================================================

void Connection::returnRawToPool() {
    std::unique_ptr<DbConnection> raw;
    {
        std::lock_guard<std::timed_mutex> lock(m_useMutex);
        raw = std::move(m_raw);
    }
    if (raw) {
        raw->closeAllPrepared();
        m_pool->release(std::move(raw));
        spdlog::debug("Connection returned to the pool");
    }
}

void Connection::releaseImpl(bool permanent, RemovalOrder order) {
    if (m_closed) {
        throw InterfaceError("The connection is already released");
    }

    if (permanent) {
        if (m_tracked) {
            if (auto context = m_context.lock()) {
                auto isThis = [this](const Connection& entry) { return &entry == this; };
                if (order == RemovalOrder::Lifo) {
                    // Throws before anything changed, the caller may retry in order
                    context->removeFromStack(m_key, isThis, order);
                } else {
                    try {
                        context->removeFromStack(m_key, isThis, order);
                    } catch (const InterfaceError& e) {
                        spdlog::warn("Released connection was missing from its context stack: {}", e.what());
                    }
                }
            }
            m_tracked = false;
        }
        m_closed = true;
    }

    if (!isReusing()) {
        returnRawToPool();
    }
}

void Connection::release(bool permanent) {
    releaseImpl(permanent, RemovalOrder::Lifo);
}

void Connection::releaseOutOfOrder() {
    releaseImpl(true, RemovalOrder::Any);
}

ConnectionPtr Connection::executionOptions(const ExecutionOptions& options) {
    checkOpen();
    return createReusing(shared_from_this(), m_options.mergedWith(options), m_timeout, true, m_token);
}

ExecutionOptions Connection::effectiveOptions(const Query& query) const {
    return m_options.mergedWith(query.options());
}

// ============================================================================
// Queries
// ============================================================================

QueryResult Connection::execute(const Query& query) {
    checkOpen();
    ExecutionOptions options = effectiveOptions(query);
    CompiledStatement statement = m_dialect->compile(query);

    Deadline deadline;
    if (options.timeout) {
        deadline = Clock::now() + *options.timeout;
    }

    auto lease = leaseRaw(acquireDeadline(deadline));
    return lease.raw->execute(statement, deadline);
}

std::vector<Row> Connection::all(const Query& query) {
    return execute(query).rows;
}

std::optional<Row> Connection::first(const Query& query) {
    auto rows = execute(query).rows;
    if (rows.empty()) {
        return std::nullopt;
    }
    return std::move(rows.front());
}

Row Connection::one(const Query& query) {
    auto rows = execute(query).rows;
    if (rows.empty()) {
        throw NoResultError();
    }
    if (rows.size() > 1) {
        throw MultipleResultsError();
    }
    return std::move(rows.front());
}

std::optional<Row> Connection::oneOrNone(const Query& query) {
    auto rows = execute(query).rows;
    if (rows.size() > 1) {
        throw MultipleResultsError();
    }
    if (rows.empty()) {
        return std::nullopt;
    }
    return std::move(rows.front());
}

Value Connection::scalar(const Query& query) {
    auto rows = execute(query).rows;
    if (rows.empty() || rows.front().empty()) {
        return Value();
    }
    return rows.front()[0];
}

QueryResult Connection::status(const Query& query) {
    return execute(query);
}

QueryResult Connection::executeMany(const std::string& sql, const std::vector<Params>& paramSets) {
    checkOpen();
    QueryResult total;
    if (paramSets.empty()) {
        return total;
    }

    std::vector<CompiledStatement> statements;
    statements.reserve(paramSets.size());
    for (const auto& params : paramSets) {
        statements.push_back(m_dialect->compile(Query(sql, params)));
    }

    Deadline deadline;
    if (m_options.timeout) {
        deadline = Clock::now() + *m_options.timeout;
    }

    auto lease = leaseRaw(acquireDeadline(deadline));
    for (const auto& statement : statements) {
        QueryResult result = lease.raw->execute(statement, deadline);
        total.rowsAffected += result.rowsAffected;
        total.statusTag = std::move(result.statusTag);
    }
    return total;
}

Cursor Connection::iterate(const Query& query) {
    checkOpen();
    ExecutionOptions options = effectiveOptions(query);
    CompiledStatement statement = m_dialect->compile(query);

    auto lease = leaseRaw(acquireDeadline(std::nullopt), false);
    if (!lease.raw || !lease.raw->inTransaction()) {
        throw InterfaceError("Cursors can only be used inside a transaction");
    }
    std::unique_ptr<DbCursor> cursor = lease.raw->openCursor(statement);
    uint64_t generation = lease.generation;
    lease.lock.unlock();

    return Cursor(shared_from_this(), std::move(cursor), generation, resolveLoader(options));
}

PreparedStatement Connection::prepare(const Query& query) {
    checkOpen();
    StatementTemplate layout = m_dialect->parse(query.sql());

    auto lease = leaseRaw(acquireDeadline(std::nullopt));
    uint64_t id = lease.raw->prepare(layout.sql);
    uint64_t generation = lease.generation;
    lease.lock.unlock();

    spdlog::debug("Prepared statement {} (generation {})", id, generation);
    return PreparedStatement(shared_from_this(), query, std::move(layout), id, generation);
}

// ============================================================================
// Transactions
// ============================================================================

std::unique_ptr<Transaction> Connection::transaction(TransactionOptions options) {
    checkOpen();
    return std::make_unique<Transaction>(shared_from_this(), options);
}

std::unique_ptr<Transaction> Connection::begin(TransactionOptions options) {
    auto tx = transaction(options);
    tx->start();
    return tx;
}

// ============================================================================
// ConnectionGuard
// ============================================================================

ConnectionGuard::ConnectionGuard(ConnectionPtr connection)
    : m_connection(std::move(connection)) {}

ConnectionGuard::~ConnectionGuard() {
    releaseQuietly();
}

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept
    : m_connection(std::move(other.m_connection)) {}

ConnectionGuard& ConnectionGuard::operator=(ConnectionGuard&& other) noexcept {
    if (this != &other) {
        releaseQuietly();
        m_connection = std::move(other.m_connection);
    }
    return *this;
}

void ConnectionGuard::release() {
    if (m_connection && !m_connection->isClosed()) {
        m_connection->release(true);
    }
}

void ConnectionGuard::releaseQuietly() noexcept {
    if (!m_connection || m_connection->isClosed()) {
        return;
    }
    try {
        m_connection->release(true);
    } catch (const InterfaceError& e) {
        spdlog::warn("Releasing connection out of order: {}", e.what());
        try {
            m_connection->releaseOutOfOrder();
        } catch (const std::exception& inner) {
            spdlog::error("Failed to release connection: {}", inner.what());
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to release connection: {}", e.what());
    }
}

}  // namespace sqlctx
