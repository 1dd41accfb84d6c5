#include "Cursor.hpp"
#include "Connection.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <exception>

namespace sqlctx {

Cursor::Cursor(std::shared_ptr<Connection> connection, std::unique_ptr<DbCursor> cursor,
               uint64_t generation, LoaderPtr loader)
    : m_connection(std::move(connection)),
      m_cursor(std::move(cursor)),
      m_generation(generation),
      m_loader(std::move(loader)) {}

Cursor::~Cursor() {
    closeQuietly();
}

Cursor::Cursor(Cursor&& other) noexcept
    : m_connection(std::move(other.m_connection)),
      m_cursor(std::move(other.m_cursor)),
      m_generation(other.m_generation),
      m_loader(std::move(other.m_loader)) {}

Cursor& Cursor::operator=(Cursor&& other) noexcept {
    if (this != &other) {
        closeQuietly();
        m_connection = std::move(other.m_connection);
        m_cursor = std::move(other.m_cursor);
        m_generation = other.m_generation;
        m_loader = std::move(other.m_loader);
    }
    return *this;
}

template <typename Fn>
auto Cursor::withCursor(Fn&& fn) -> decltype(fn(std::declval<DbCursor&>())) {
    if (!m_cursor) {
        throw InterfaceError("The cursor is closed");
    }
    auto lease = m_connection->leaseRaw(m_connection->acquireDeadline(std::nullopt), false);
    if (!lease.raw || lease.generation != m_generation) {
        throw InterfaceError("The connection of this cursor was released");
    }
    if (!lease.raw->inTransaction()) {
        throw InterfaceError("The transaction of this cursor has ended");
    }
    return fn(*m_cursor);
}

std::optional<Row> Cursor::next() {
    return withCursor([](DbCursor& cursor) { return cursor.fetchOne(); });
}

std::vector<Row> Cursor::many(size_t n) {
    return withCursor([n](DbCursor& cursor) { return cursor.fetchMany(n); });
}

size_t Cursor::forward(size_t n) {
    return withCursor([n](DbCursor& cursor) { return cursor.skip(n); });
}

void Cursor::close() {
    if (!m_cursor) {
        return;
    }
    std::unique_ptr<DbCursor> cursor = std::move(m_cursor);

    // Only touch the driver while it still is the connection the cursor runs on
    if (m_connection->isClosed()) {
        return;
    }
    auto lease = m_connection->leaseRaw(m_connection->acquireDeadline(std::nullopt), false);
    if (lease.raw && lease.generation == m_generation) {
        cursor->close();
        cursor.reset();
    }
}

void Cursor::closeQuietly() noexcept {
    try {
        close();
    } catch (const std::exception& e) {
        spdlog::warn("Failed to close cursor: {}", e.what());
    }
}

}  // namespace sqlctx
