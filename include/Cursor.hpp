#pragma once

#include "DbConnection.hpp"
#include "Loader.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace sqlctx {

class Connection;

/**
 * @class Cursor
 * @brief Streaming rows of one query, bound to the transaction it runs in.
 *
 * Every fetch checks that the handle is open, that its root still holds the
 * physical connection the cursor was opened on and that this connection is
 * still in a transaction; otherwise InterfaceError is thrown. Fetches lock
 * the root like any other statement.
 */
class Cursor {
public:
    Cursor(std::shared_ptr<Connection> connection, std::unique_ptr<DbCursor> cursor,
           uint64_t generation, LoaderPtr loader);

    /**
     * @brief Destructor - closes the cursor if the connection still allows it.
     */
    ~Cursor();

    // Non-copyable
    Cursor(const Cursor&) = delete;
    Cursor& operator=(const Cursor&) = delete;

    // Movable
    Cursor(Cursor&& other) noexcept;
    Cursor& operator=(Cursor&& other) noexcept;

    // Next row, or nothing when exhausted
    std::optional<Row> next();

    // Up to n rows
    std::vector<Row> many(size_t n);

    // Skip up to n rows, returns how many were skipped
    size_t forward(size_t n);

    void close();
    bool isClosed() const { return m_cursor == nullptr; }

    // next() with the query's loader applied
    template <typename T>
    std::optional<T> nextAs() {
        auto row = next();
        if (!row) return std::nullopt;
        return loadAs<T>(*row, m_loader);
    }

private:
    // Run fn on the driver cursor with the root locked and validated
    template <typename Fn>
    auto withCursor(Fn&& fn) -> decltype(fn(std::declval<DbCursor&>()));

    void closeQuietly() noexcept;

    std::shared_ptr<Connection> m_connection;
    std::unique_ptr<DbCursor> m_cursor;
    uint64_t m_generation;
    LoaderPtr m_loader;
};

}  // namespace sqlctx
