#pragma once

/**
 * @file QueuePool.hpp
 * @brief Thread-safe bounded connection pool with overflow.
 *
 * The pool keeps up to `pool_size` idle connections and may open
 * `max_overflow` more on demand. Overflow connections are closed instead of
 * kept when they come back while the idle queue is full.
 */

#include "ConnectionPool.hpp"
#include "Config.hpp"
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

namespace sqlctx {

/**
 * @class QueuePool
 * @brief Pool of reusable physical connections with bounded overflow.
 *
 * Key features:
 * - Connections are opened lazily by the factory, never at construction
 * - Bounded overflow, or unlimited with `max_overflow = -1`
 * - Blocking acquire with a deadline and cooperative cancellation
 * - FIFO (default) or LIFO reuse of idle connections
 * - Reset (rollback) on return, optional ping before lending out
 *
 * Accounting follows the overflow counter: it starts at `-pool_size`, is
 * incremented for every connection opened and decremented for every
 * connection closed, so `checkedOut = pool_size - checkedIn + overflow`.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - A DbConnection obtained from acquire() belongs to its borrower until released
 */
class QueuePool : public ConnectionPool {
public:
    QueuePool(Factory factory, PoolOptions options = {});

    /**
     * @brief Destructor - closes the pool and idle connections.
     */
    ~QueuePool() override;

    std::unique_ptr<DbConnection> acquire(Deadline deadline = std::nullopt,
                                          const CancellationToken* token = nullptr) override;
    void release(std::unique_ptr<DbConnection> connection) override;
    void close() override;
    bool isClosed() const override;

    PoolStatus status() const override;
    std::chrono::milliseconds timeout() const override { return m_options.timeout; }

    const PoolOptions& options() const { return m_options; }

private:
    // Callers hold m_mutex
    bool canOverflow() const;

    // Open a connection for a slot already counted in m_overflow
    std::unique_ptr<DbConnection> createConnection();

    // Close a connection and free its slot
    void discardConnection(std::unique_ptr<DbConnection> connection);

    Factory m_factory;
    PoolOptions m_options;

    std::deque<std::unique_ptr<DbConnection>> m_idle;  ///< Idle connections
    int64_t m_overflow;                                ///< Opened connections minus pool_size
    size_t m_waiting = 0;                              ///< Threads blocked on acquire()
    bool m_closed = false;

    mutable std::mutex m_mutex;    ///< Protects everything above
    std::condition_variable m_cv;  ///< Signaled when a connection or a slot frees up
};

}  // namespace sqlctx
