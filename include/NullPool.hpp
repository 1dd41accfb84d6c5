#pragma once

#include "ConnectionPool.hpp"
#include <atomic>

namespace sqlctx {

/**
 * @class NullPool
 * @brief Opens a new connection for every acquire and closes it on release.
 */
class NullPool : public ConnectionPool {
public:
    explicit NullPool(Factory factory, std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));
    ~NullPool() override;

    std::unique_ptr<DbConnection> acquire(Deadline deadline = std::nullopt,
                                          const CancellationToken* token = nullptr) override;
    void release(std::unique_ptr<DbConnection> connection) override;
    void close() override;
    bool isClosed() const override { return m_closed.load(); }

    PoolStatus status() const override;
    std::chrono::milliseconds timeout() const override { return m_timeout; }

private:
    Factory m_factory;
    std::chrono::milliseconds m_timeout;
    std::atomic<int64_t> m_checkedOut{0};
    std::atomic<bool> m_closed{false};
};

}  // namespace sqlctx
