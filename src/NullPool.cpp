#include "NullPool.hpp"
#include "CancellationToken.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>

namespace sqlctx {

NullPool::NullPool(Factory factory, std::chrono::milliseconds timeout)
    : m_factory(std::move(factory)), m_timeout(timeout) {
    if (!m_factory) {
        throw InterfaceError("NullPool requires a connection factory");
    }
    spdlog::info("Connection pool created (no pooling)");
}

NullPool::~NullPool() {
    close();
}

std::unique_ptr<DbConnection> NullPool::acquire(Deadline, const CancellationToken* token) {
    if (m_closed) {
        throw PoolClosedError("Pool is closed");
    }
    if (token) {
        token->throwIfCancelled();
    }

    auto conn = m_factory();
    if (!conn) {
        throw InterfaceError("Connection factory returned no connection");
    }
    m_checkedOut++;
    return conn;
}

void NullPool::release(std::unique_ptr<DbConnection> connection) {
    if (!connection) return;
    connection.reset();
    m_checkedOut--;
}

void NullPool::close() {
    if (!m_closed.exchange(true)) {
        spdlog::info("Connection pool closed");
    }
}

PoolStatus NullPool::status() const {
    PoolStatus status;
    status.checkedOut = m_checkedOut.load();
    status.timeout = m_timeout;
    return status;
}

}  // namespace sqlctx
