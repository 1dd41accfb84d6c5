#pragma once

#include "Loader.hpp"
#include "TransactionOptions.hpp"
#include "Value.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sqlctx {

/**
 * @struct ExecutionOptions
 * @brief Non-SQL options applied while executing a query.
 *
 * Unset fields inherit from the options they are merged over, so a query can
 * override only what it needs on top of a connection's options.
 */
struct ExecutionOptions {
    std::optional<bool> returnModel;                  ///< Apply model/loader (default true)
    LoaderPtr model;                                  ///< Loader used when no explicit loader
    std::optional<std::chrono::milliseconds> timeout; ///< Acquire + execute budget
    LoaderPtr loader;                                 ///< Explicit row loader
    std::optional<IsolationLevel> isolationLevel;     ///< Default for root transactions

    // Copy of *this with every field set in `overrides` replaced
    ExecutionOptions mergedWith(const ExecutionOptions& overrides) const;
};

// Loader that applies to results produced with these options, or nullptr
LoaderPtr resolveLoader(const ExecutionOptions& options);

/**
 * @class Query
 * @brief Immutable query descriptor: SQL text, parameters, execution options.
 *
 * Builder methods return modified copies, so one query template can be
 * shared between tasks.
 */
class Query {
public:
    Query(std::string sql, Params params = {}, ExecutionOptions options = {});
    Query(const char* sql) : Query(std::string(sql)) {}

    const std::string& sql() const { return m_sql; }
    const Params& params() const { return m_params; }
    const ExecutionOptions& options() const { return m_options; }

    Query withParams(Params params) const;
    Query executionOptions(const ExecutionOptions& options) const;

private:
    std::string m_sql;
    Params m_params;
    ExecutionOptions m_options;
};

// Statement in the dialect's parameter style, ready for a driver
struct CompiledStatement {
    std::string sql;
    std::vector<Value> params;
};

}  // namespace sqlctx
