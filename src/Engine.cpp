#include "Engine.hpp"
#include "Errors.hpp"
#include "NullPool.hpp"
#include "QueuePool.hpp"
#include <spdlog/spdlog.h>

namespace sqlctx {

// ============================================================================
// Construction
// ============================================================================

Engine::Engine(DialectPtr dialect, ConnectionPoolPtr pool, ExecutionOptions options)
    : m_dialect(std::move(dialect)),
      m_pool(std::move(pool)),
      m_key(ExecutionContext::newKey()),
      m_options(std::move(options)) {
    if (!m_dialect || !m_pool) {
        throw InterfaceError("Engine requires a dialect and a pool");
    }
}

std::shared_ptr<Engine> Engine::create(Config config) {
    config.resolvePassword();
    if (!config.validate()) {
        throw InterfaceError("Invalid engine configuration");
    }

    DialectPtr dialect = createDialect(config.backendName());
    ConnectionPool::Factory factory = [dialect, connection = config.connection]() {
        return dialect->connect(connection);
    };

    ConnectionPoolPtr pool;
    if (config.pool.null_pool) {
        pool = std::make_shared<NullPool>(factory, config.pool.timeout);
    } else {
        pool = std::make_shared<QueuePool>(factory, config.pool.resolve());
    }

    ExecutionOptions options;
    if (!config.engine.isolation_level.empty()) {
        options.isolationLevel = parseIsolationLevel(config.engine.isolation_level);
    }

    auto engine = std::make_shared<Engine>(dialect, pool, options);
    engine->warmUp(config.pool.min_size);

    spdlog::info("Engine created for {} database '{}'", dialect->name(), config.connection.database);
    return engine;
}

std::shared_ptr<Engine> Engine::create(const std::string& url) {
    auto config = Config::fromUrl(url);
    if (!config) {
        throw InterfaceError("Malformed database URL");
    }
    return create(*config);
}

void Engine::warmUp(size_t count) {
    std::vector<std::unique_ptr<DbConnection>> connections;
    try {
        for (size_t i = 0; i < count; ++i) {
            connections.push_back(m_pool->acquire());
        }
    } catch (...) {
        for (auto& conn : connections) {
            m_pool->release(std::move(conn));
        }
        throw;
    }
    for (auto& conn : connections) {
        m_pool->release(std::move(conn));
    }
}

// ============================================================================
// Acquire
// ============================================================================

AcquireOptions Engine::reuseOptions() {
    AcquireOptions options;
    options.reuse = true;
    return options;
}

AcquireOptions Engine::defaultTransactionAcquire() {
    AcquireOptions options;
    options.reuse = true;
    options.reusable = true;
    return options;
}

ConnectionGuard Engine::acquire(const AcquireOptions& options) {
    if (m_pool->isClosed()) {
        throw PoolClosedError("Pool is closed");
    }

    auto context = ExecutionContext::current();
    ExecutionOptions executionOptions = this->executionOptions();

    if (options.reuse) {
        if (auto current = context->top(m_key)) {
            auto conn = Connection::createReusing(current, current->executionOptions(), options.timeout,
                                                  options.lazy, context->cancellationToken());
            if (!options.lazy) {
                try {
                    conn->getRawConnection(options.timeout);
                } catch (...) {
                    conn->release();
                    throw;
                }
            }
            spdlog::debug("Reusing current connection");
            return ConnectionGuard(conn);
        }
    }

    auto conn = Connection::createRoot(m_pool, m_dialect, executionOptions, options.timeout,
                                       options.lazy, context->cancellationToken());
    if (options.reusable) {
        context->push(m_key, conn);
        conn->track(context, m_key);
    }

    // Eager acquisition failed: take the handle back out so nothing leaks
    if (!options.lazy) {
        try {
            conn->getRawConnection(options.timeout);
        } catch (...) {
            conn->releaseOutOfOrder();
            throw;
        }
    }

    spdlog::debug("Acquired {}{} connection", options.lazy ? "lazy " : "",
                  options.reusable ? "reusable" : "private");
    return ConnectionGuard(conn);
}

ConnectionGuard Engine::connect() {
    AcquireOptions options;
    options.reusable = false;
    return acquire(options);
}

ConnectionPtr Engine::currentConnection() const {
    return ExecutionContext::current()->top(m_key);
}

// ============================================================================
// Query shortcuts
// ============================================================================

std::vector<Row> Engine::all(const Query& query) {
    auto conn = acquire(reuseOptions());
    return conn->all(query);
}

std::optional<Row> Engine::first(const Query& query) {
    auto conn = acquire(reuseOptions());
    return conn->first(query);
}

Row Engine::one(const Query& query) {
    auto conn = acquire(reuseOptions());
    return conn->one(query);
}

std::optional<Row> Engine::oneOrNone(const Query& query) {
    auto conn = acquire(reuseOptions());
    return conn->oneOrNone(query);
}

Value Engine::scalar(const Query& query) {
    auto conn = acquire(reuseOptions());
    return conn->scalar(query);
}

QueryResult Engine::status(const Query& query) {
    auto conn = acquire(reuseOptions());
    return conn->status(query);
}

QueryResult Engine::executeMany(const std::string& sql, const std::vector<Params>& paramSets) {
    auto conn = acquire(reuseOptions());
    return conn->executeMany(sql, paramSets);
}

Cursor Engine::iterate(const Query& query) {
    auto current = currentConnection();
    if (!current) {
        throw InterfaceError("No connection in the current context, acquire one and start a transaction first");
    }
    return current->iterate(query);
}

void Engine::transaction(const Transaction::Body& body, const TransactionOptions& options,
                         AcquireOptions acquireOptions) {
    auto conn = acquire(acquireOptions);
    Transaction tx(conn.get(), options);
    tx.run(body);
}

CompiledStatement Engine::compile(const Query& query) const {
    return m_dialect->compile(query);
}

// ============================================================================
// Lifecycle and Statistics
// ============================================================================

void Engine::close() {
    m_pool->close();
}

bool Engine::isClosed() const {
    return m_pool->isClosed();
}

PoolStatus Engine::status() const {
    return m_pool->status();
}

nlohmann::json Engine::describe() const {
    ExecutionOptions options = executionOptions();
    nlohmann::json doc = {
        {"dialect", m_dialect->name()},
        {"closed", isClosed()},
        {"pool", status().toJson()}
    };
    if (options.isolationLevel) {
        doc["isolation_level"] = toString(*options.isolationLevel);
    }
    if (options.timeout) {
        doc["timeout_ms"] = options.timeout->count();
    }
    return doc;
}

void Engine::updateExecutionOptions(const ExecutionOptions& options) {
    std::lock_guard<std::mutex> lock(m_optionsMutex);
    m_options = m_options.mergedWith(options);
}

ExecutionOptions Engine::executionOptions() const {
    std::lock_guard<std::mutex> lock(m_optionsMutex);
    return m_options;
}

}  // namespace sqlctx
