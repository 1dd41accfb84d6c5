#include "QueuePool.hpp"
#include "CancellationToken.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

namespace sqlctx {

// ============================================================================
// Construction and Destruction
// ============================================================================

QueuePool::QueuePool(Factory factory, PoolOptions options)
    : m_factory(std::move(factory)),
      m_options(options),
      m_overflow(-static_cast<int64_t>(options.pool_size)) {
    if (!m_factory) {
        throw InterfaceError("QueuePool requires a connection factory");
    }
    spdlog::info("Connection pool created (size {}, max overflow {}, timeout {} ms, {})",
                 m_options.pool_size, m_options.max_overflow, m_options.timeout.count(),
                 m_options.use_lifo ? "LIFO" : "FIFO");
}

QueuePool::~QueuePool() {
    close();
}

// ============================================================================
// Acquire / Release
// ============================================================================

bool QueuePool::canOverflow() const {
    return m_options.max_overflow < 0 || m_overflow < m_options.max_overflow;
}

std::unique_ptr<DbConnection> QueuePool::createConnection() {
    std::unique_ptr<DbConnection> conn;
    try {
        conn = m_factory();
        if (!conn) {
            throw InterfaceError("Connection factory returned no connection");
        }
    } catch (...) {
        // Free the slot taken for this connection and let the error through
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_overflow--;
        }
        m_cv.notify_all();
        throw;
    }
    spdlog::debug("Opened pooled connection");
    return conn;
}

std::unique_ptr<DbConnection> QueuePool::acquire(Deadline deadline, const CancellationToken* token) {
    auto effective = Clock::now() + m_options.timeout;
    if (deadline && *deadline < effective) {
        effective = *deadline;
    }

    CancellationToken::Registration registration;
    if (token) {
        token->throwIfCancelled();
        registration = token->subscribe([this]() {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cv.notify_all();
        });
    }

    std::unique_lock<std::mutex> lock(m_mutex);

    auto ready = [&]() {
        return m_closed || (token && token->isCancelled()) || !m_idle.empty() || canOverflow();
    };

    if (!ready()) {
        m_waiting++;
        bool woken = m_cv.wait_until(lock, effective, ready);
        m_waiting--;
        if (!woken) {
            throw TimeoutError(fmt::format(
                "QueuePool limit of size {} overflow {} reached, connection timed out, timeout {} ms",
                m_options.pool_size, m_overflow, m_options.timeout.count()));
        }
    }

    if (m_closed) {
        throw PoolClosedError("Pool is closed");
    }
    if (token && token->isCancelled()) {
        throw CancelledError("Cancelled while waiting for a database connection");
    }

    if (!m_idle.empty()) {
        std::unique_ptr<DbConnection> conn;
        if (m_options.use_lifo) {
            conn = std::move(m_idle.back());
            m_idle.pop_back();
        } else {
            conn = std::move(m_idle.front());
            m_idle.pop_front();
        }
        lock.unlock();

        // Validate the connection, replace it in the same slot if stale
        if (m_options.pre_ping && !conn->ping()) {
            spdlog::debug("Pooled connection failed pre-ping, reconnecting");
            conn.reset();
            return createConnection();
        }
        return conn;
    }

    // Pool is empty but a new connection is allowed
    m_overflow++;
    lock.unlock();
    return createConnection();
}

void QueuePool::release(std::unique_ptr<DbConnection> connection) {
    if (!connection) return;

    bool closed;
    size_t checkedIn;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        closed = m_closed;
        checkedIn = m_idle.size();
    }

    // Try to reset the connection so that it can be reused
    if (!closed && m_options.reset_on_return && checkedIn < m_options.pool_size) {
        try {
            connection->reset();
        } catch (const std::exception& e) {
            spdlog::error("Exception during reset on return: {}", e.what());
            discardConnection(std::move(connection));
            return;
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_closed && m_idle.size() < m_options.pool_size && connection->isValid()) {
            m_idle.push_back(std::move(connection));
            m_cv.notify_one();
            return;
        }
    }

    discardConnection(std::move(connection));
}

void QueuePool::discardConnection(std::unique_ptr<DbConnection> connection) {
    connection.reset();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_overflow--;
        spdlog::debug("Closed pooled connection (overflow: {})", m_overflow);
    }
    m_cv.notify_all();
}

// ============================================================================
// Shutdown and Statistics
// ============================================================================

void QueuePool::close() {
    std::deque<std::unique_ptr<DbConnection>> idle;
    bool wasClosed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        wasClosed = m_closed;
        m_closed = true;
        idle.swap(m_idle);
        m_overflow -= static_cast<int64_t>(idle.size());
    }
    m_cv.notify_all();

    // Connections still lent out are closed when they come back
    idle.clear();
    if (!wasClosed) {
        spdlog::info("Connection pool closed");
    }
}

bool QueuePool::isClosed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

PoolStatus QueuePool::status() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    PoolStatus status;
    status.size = m_options.pool_size;
    status.overflow = m_overflow;
    status.checkedIn = m_idle.size();
    status.checkedOut = static_cast<int64_t>(m_options.pool_size) -
                        static_cast<int64_t>(m_idle.size()) + m_overflow;
    status.waiting = m_waiting;
    status.timeout = m_options.timeout;
    return status;
}

}  // namespace sqlctx
