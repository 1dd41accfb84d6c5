#pragma once

#include "Engine.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace sqlctx {

/**
 * @class Database
 * @brief Application-wide holder of the engine in use.
 *
 * Code written against a Database does not need to know which engine it
 * runs on until the first query; operations on an unbound Database throw
 * UninitializedError.
 */
class Database {
public:
    Database() = default;
    explicit Database(EnginePtr engine);

    // Non-copyable
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    EnginePtr setBind(EnginePtr engine);
    EnginePtr setBind(const Config& config);
    EnginePtr setBind(const std::string& url);

    // Unbind and return the previous engine (nullptr if none)
    EnginePtr popBind();

    bool isBound() const;

    // @throws UninitializedError when unbound
    EnginePtr bind() const;

    ConnectionGuard acquire(const AcquireOptions& options = {});
    std::vector<Row> all(const Query& query);
    std::optional<Row> first(const Query& query);
    Row one(const Query& query);
    std::optional<Row> oneOrNone(const Query& query);
    Value scalar(const Query& query);
    QueryResult status(const Query& query);
    void transaction(const Transaction::Body& body, const TransactionOptions& options = {});
    Cursor iterate(const Query& query);
    CompiledStatement compile(const Query& query) const;

private:
    mutable std::mutex m_mutex;
    EnginePtr m_bind;
};

/**
 * @class BindScope
 * @brief Binds an engine for the scope lifetime and restores the previous bind.
 */
class BindScope {
public:
    BindScope(Database& database, EnginePtr engine);
    ~BindScope();

    BindScope(const BindScope&) = delete;
    BindScope& operator=(const BindScope&) = delete;

private:
    Database& m_database;
    EnginePtr m_previous;
};

}  // namespace sqlctx
