#pragma once

/**
 * @file Engine.hpp
 * @brief Entry point: a dialect plus a pool, bound to the execution context.
 */

#include "Config.hpp"
#include "Connection.hpp"
#include "ConnectionPool.hpp"
#include "Cursor.hpp"
#include "Dialect.hpp"
#include "ExecutionContext.hpp"
#include "Query.hpp"
#include "Transaction.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sqlctx {

/**
 * @class Engine
 * @brief Hands out connection handles and runs queries on them.
 *
 * Handles acquired with `reusable = true` are remembered in the calling
 * task's context, so that nested code using `reuse = true` (which is what
 * all the query shortcuts of this class do) runs on the same physical
 * connection, and therefore inside the same transaction:
 *
 * @code
 *   auto engine = Engine::create(*Config::fromUrl("sqlite:///app.db"));
 *   engine->transaction([&](Transaction&) {
 *       engine->status("UPDATE counter SET value = value + 1");  // same connection
 *   });
 * @endcode
 *
 * Thread Safety:
 * - All methods are thread-safe; every thread works on its own context stack
 */
class Engine {
public:
    Engine(DialectPtr dialect, ConnectionPoolPtr pool, ExecutionOptions options = {});

    /**
     * @brief Build an engine from configuration.
     *
     * Creates the dialect and the pool, then opens `pool.min_size`
     * connections and puts them in the pool.
     * @throws InterfaceError for invalid configuration, driver errors if the
     *         initial connections fail.
     */
    static std::shared_ptr<Engine> create(Config config);

    // create() from a database URL
    static std::shared_ptr<Engine> create(const std::string& url);

    // Non-copyable
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * @brief Acquire a connection handle.
     *
     * With `reuse` and an open reusable handle in the current context, the
     * result shares that handle's physical connection. Otherwise a new root
     * handle is created and, when `reusable`, pushed on the context stack.
     * Unless `lazy`, the physical connection is borrowed before returning.
     */
    ConnectionGuard acquire(const AcquireOptions& options = {});

    // New physical connection, invisible to reuse
    ConnectionGuard connect();

    // Latest open reusable handle of the current context, or nullptr
    ConnectionPtr currentConnection() const;

    // ----- Query shortcuts, all run on acquire({reuse = true}) -----

    std::vector<Row> all(const Query& query);
    std::optional<Row> first(const Query& query);
    Row one(const Query& query);
    std::optional<Row> oneOrNone(const Query& query);
    Value scalar(const Query& query);
    QueryResult status(const Query& query);
    QueryResult executeMany(const std::string& sql, const std::vector<Params>& paramSets);

    template <typename T>
    std::vector<T> allAs(const Query& query) {
        auto conn = acquire(reuseOptions());
        return conn->allAs<T>(query);
    }

    template <typename T>
    std::optional<T> firstAs(const Query& query) {
        auto conn = acquire(reuseOptions());
        return conn->firstAs<T>(query);
    }

    template <typename T>
    T oneAs(const Query& query) {
        auto conn = acquire(reuseOptions());
        return conn->oneAs<T>(query);
    }

    template <typename T>
    std::optional<T> oneOrNoneAs(const Query& query) {
        auto conn = acquire(reuseOptions());
        return conn->oneOrNoneAs<T>(query);
    }

    /**
     * @brief Stream a query on the current connection.
     * @throws InterfaceError without a current connection in a transaction.
     */
    Cursor iterate(const Query& query);

    /**
     * @brief Run `body` in a managed transaction on a reused connection.
     *
     * The default acquire options reuse the current connection, so a
     * transaction started inside another one becomes a savepoint.
     */
    void transaction(const Transaction::Body& body,
                     const TransactionOptions& options = {},
                     AcquireOptions acquireOptions = defaultTransactionAcquire());

    CompiledStatement compile(const Query& query) const;

    // Close the pool; later acquisitions raise PoolClosedError
    void close();
    bool isClosed() const;

    PoolStatus status() const;

    // Dialect, pool statistics and options as a JSON document
    nlohmann::json describe() const;

    // Options inherited by every handle acquired from now on
    void updateExecutionOptions(const ExecutionOptions& options);
    ExecutionOptions executionOptions() const;

    const DialectPtr& dialect() const { return m_dialect; }
    const ConnectionPoolPtr& pool() const { return m_pool; }
    ExecutionContext::Key key() const { return m_key; }

    static AcquireOptions defaultTransactionAcquire();

private:
    static AcquireOptions reuseOptions();

    // Borrow and give back min_size connections
    void warmUp(size_t count);

    DialectPtr m_dialect;
    ConnectionPoolPtr m_pool;
    ExecutionContext::Key m_key;

    mutable std::mutex m_optionsMutex;
    ExecutionOptions m_options;
};

using EnginePtr = std::shared_ptr<Engine>;

}  // namespace sqlctx
