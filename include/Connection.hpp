#pragma once

/**
 * @file Connection.hpp
 * @brief Logical connection handles borrowed from an Engine.
 *
 * A Connection is what application code holds. It is either a *root*
 * handle, owning at most one physical connection borrowed from the pool, or
 * a *reusing* handle that shares the physical connection of a root. The
 * physical connection may be absent: handles acquired lazily, or softly
 * released, materialize it again transparently on first use.
 */

#include "CancellationToken.hpp"
#include "ConnectionPool.hpp"
#include "Cursor.hpp"
#include "DbConnection.hpp"
#include "Dialect.hpp"
#include "ExecutionContext.hpp"
#include "Loader.hpp"
#include "PreparedStatement.hpp"
#include "Query.hpp"
#include "Transaction.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace sqlctx {

struct AcquireOptions {
    std::optional<std::chrono::milliseconds> timeout;  ///< Budget for lock + pool wait
    bool reuse = false;     ///< Share the latest reusable connection of the context
    bool lazy = false;      ///< Defer borrowing the physical connection to first use
    bool reusable = true;   ///< Let nested reuse = true acquisitions find this handle
};

class Connection : public std::enable_shared_from_this<Connection> {
public:
    // Exclusive use of the physical connection of a root
    struct RawLease {
        std::unique_lock<std::timed_mutex> lock;
        DbConnection* raw = nullptr;
        uint64_t generation = 0;
    };

    static ConnectionPtr createRoot(ConnectionPoolPtr pool,
                                    DialectPtr dialect,
                                    ExecutionOptions options,
                                    std::optional<std::chrono::milliseconds> timeout,
                                    bool lazy,
                                    CancellationTokenPtr token);

    static ConnectionPtr createReusing(const ConnectionPtr& connection,
                                       ExecutionOptions options,
                                       std::optional<std::chrono::milliseconds> timeout,
                                       bool lazy,
                                       CancellationTokenPtr token);

    ~Connection();

    // Non-copyable
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    bool isReusing() const { return m_root != nullptr; }
    bool isLazy() const { return m_lazy; }
    bool isClosed() const { return m_closed.load(); }
    bool isTracked() const { return m_tracked; }

    // The root handle, *this for a root
    ConnectionPtr root();

    const DialectPtr& dialect() const { return m_dialect; }
    const ExecutionOptions& executionOptions() const { return m_options; }
    std::optional<std::chrono::milliseconds> timeout() const { return m_timeout; }

    // Physical connection currently held by the root, nullptr if none
    DbConnection* rawConnection() const;

    /**
     * @brief Physical connection of the root, borrowed from the pool if needed.
     *
     * The returned pointer stays valid until the root releases it; use it
     * only from the owning task.
     * @throws TimeoutError, CancelledError, PoolClosedError, driver errors.
     */
    DbConnection* getRawConnection(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief Release the handle.
     *
     * Permanent release closes the handle and removes it from its context
     * stack; soft release only gives the physical connection back to the pool
     * and keeps the handle usable. Only roots give connections back.
     *
     * @throws InterfaceError if the handle is already closed, or when a
     *         reusable handle is released before the handles acquired after it.
     */
    void release(bool permanent = true);

    // Permanent release that ignores the order of the context stack
    void releaseOutOfOrder();

    /**
     * @brief New reusing handle with `options` merged over this handle's.
     *
     * This handle is left untouched.
     */
    ConnectionPtr executionOptions(const ExecutionOptions& options);

    // ----- Queries -----

    std::vector<Row> all(const Query& query);
    std::optional<Row> first(const Query& query);

    // @throws NoResultError, MultipleResultsError
    Row one(const Query& query);

    // @throws MultipleResultsError
    std::optional<Row> oneOrNone(const Query& query);

    // First column of the first row, NULL if there is none
    Value scalar(const Query& query);

    QueryResult status(const Query& query);

    // Runs the statement once per parameter set, results are discarded
    QueryResult executeMany(const std::string& sql, const std::vector<Params>& paramSets);

    template <typename T>
    std::vector<T> allAs(const Query& query) {
        LoaderPtr loader = resolveLoader(effectiveOptions(query));
        std::vector<T> result;
        for (const auto& row : all(query)) {
            result.push_back(loadAs<T>(row, loader));
        }
        return result;
    }

    template <typename T>
    std::optional<T> firstAs(const Query& query) {
        LoaderPtr loader = resolveLoader(effectiveOptions(query));
        auto row = first(query);
        if (!row) return std::nullopt;
        return loadAs<T>(*row, loader);
    }

    template <typename T>
    T oneAs(const Query& query) {
        return loadAs<T>(one(query), resolveLoader(effectiveOptions(query)));
    }

    template <typename T>
    std::optional<T> oneOrNoneAs(const Query& query) {
        LoaderPtr loader = resolveLoader(effectiveOptions(query));
        auto row = oneOrNone(query);
        if (!row) return std::nullopt;
        return loadAs<T>(*row, loader);
    }

    /**
     * @brief Stream the rows of a query.
     * @throws InterfaceError unless a transaction is open on this connection.
     */
    Cursor iterate(const Query& query);

    /**
     * @brief Prepare a query on the physical connection, materializing it.
     *
     * The statement stays usable until the physical connection goes back to
     * the pool.
     * @throws InterfaceError if the handle is closed, driver errors if the
     *         statement does not compile.
     */
    PreparedStatement prepare(const Query& query);

    // ----- Transactions -----

    // Transaction object, not started yet
    std::unique_ptr<Transaction> transaction(TransactionOptions options = {});

    // Started manual transaction
    std::unique_ptr<Transaction> begin(TransactionOptions options = {});

    // ----- Internal, used by Engine, Transaction and Cursor -----

    void track(const std::shared_ptr<ExecutionContext>& context, ExecutionContext::Key key);

    /**
     * @brief Lock the root's physical connection.
     *
     * Waits for the root mutex and, when `materialize` is set and the root
     * holds no physical connection, for the pool; both waits share `deadline`.
     * @throws InterfaceError if this handle or its root is closed.
     */
    RawLease leaseRaw(Deadline deadline, bool materialize = true);

    // Options of this handle with the query's options merged over
    ExecutionOptions effectiveOptions(const Query& query) const;

    // `operationDeadline` if set, else the acquire timeout from now
    Deadline acquireDeadline(Deadline operationDeadline) const;

private:
    Connection(ConnectionPoolPtr pool, DialectPtr dialect, ConnectionPtr root,
               ExecutionOptions options, std::optional<std::chrono::milliseconds> timeout,
               bool lazy, CancellationTokenPtr token);

    void checkOpen() const;
    QueryResult execute(const Query& query);
    void returnRawToPool();
    void releaseImpl(bool permanent, RemovalOrder order);

    ConnectionPoolPtr m_pool;
    DialectPtr m_dialect;
    ConnectionPtr m_root;  ///< nullptr for a root handle
    ExecutionOptions m_options;
    std::optional<std::chrono::milliseconds> m_timeout;
    bool m_lazy;
    CancellationTokenPtr m_token;
    std::atomic<bool> m_closed{false};

    // Context stack membership
    bool m_tracked = false;
    std::weak_ptr<ExecutionContext> m_context;
    ExecutionContext::Key m_key = 0;

    // Root only
    mutable std::timed_mutex m_useMutex;  ///< Serializes physical use
    std::unique_ptr<DbConnection> m_raw;  ///< Guarded by m_useMutex
    uint64_t m_generation = 0;            ///< Incremented per materialization
};

/**
 * @class ConnectionGuard
 * @brief Scope owning an acquired handle, released permanently on exit.
 *
 * Move-only. A guard destroyed out of order (for example while an exception
 * unwinds two guards acquired in one scope in the wrong order) logs the
 * problem and still releases the handle so the pool stays balanced.
 */
class ConnectionGuard {
public:
    ConnectionGuard() = default;
    explicit ConnectionGuard(ConnectionPtr connection);
    ~ConnectionGuard();

    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;
    ConnectionGuard(ConnectionGuard&& other) noexcept;
    ConnectionGuard& operator=(ConnectionGuard&& other) noexcept;

    Connection* operator->() const { return m_connection.get(); }
    Connection& operator*() const { return *m_connection; }
    const ConnectionPtr& get() const { return m_connection; }
    explicit operator bool() const { return m_connection != nullptr; }

    // Release now, errors propagate
    void release();

private:
    void releaseQuietly() noexcept;

    ConnectionPtr m_connection;
};

}  // namespace sqlctx
