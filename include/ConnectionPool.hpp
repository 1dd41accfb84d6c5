#pragma once

#include "DbConnection.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace sqlctx {

class CancellationToken;

// Snapshot of pool accounting
struct PoolStatus {
    size_t size = 0;          ///< Idle capacity of the pool
    int64_t overflow = 0;     ///< Connections opened beyond size (negative while below size)
    size_t checkedIn = 0;     ///< Idle connections
    int64_t checkedOut = 0;   ///< Connections lent out
    size_t waiting = 0;       ///< Threads blocked in acquire()
    std::chrono::milliseconds timeout{0};

    nlohmann::json toJson() const;
};

class ConnectionPool {
public:
    using Factory = std::function<std::unique_ptr<DbConnection>()>;

    virtual ~ConnectionPool() = default;

    // Non-copyable, non-movable
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Borrow a physical connection.
     * @param deadline Latest point in time to wait until; the pool timeout
     *        applies as well, whichever comes first.
     * @param token Optional cancellation token; cancelling it wakes the wait.
     * @throws TimeoutError, CancelledError, PoolClosedError, or the driver
     *         error raised while opening a new connection.
     */
    virtual std::unique_ptr<DbConnection> acquire(Deadline deadline = std::nullopt,
                                                  const CancellationToken* token = nullptr) = 0;

    // Give a connection back; the pool decides whether to keep or close it
    virtual void release(std::unique_ptr<DbConnection> connection) = 0;

    // Close idle connections and refuse further acquisitions
    virtual void close() = 0;
    virtual bool isClosed() const = 0;

    // Pool statistics
    virtual PoolStatus status() const = 0;
    virtual std::chrono::milliseconds timeout() const = 0;

    // Health check
    bool healthCheck();

protected:
    ConnectionPool() = default;
};

using ConnectionPoolPtr = std::shared_ptr<ConnectionPool>;

}  // namespace sqlctx
