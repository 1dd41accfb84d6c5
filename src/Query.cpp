#include "Query.hpp"
#include <utility>

namespace sqlctx {

ExecutionOptions ExecutionOptions::mergedWith(const ExecutionOptions& overrides) const {
    ExecutionOptions result = *this;
    if (overrides.returnModel) result.returnModel = overrides.returnModel;
    if (overrides.model) result.model = overrides.model;
    if (overrides.timeout) result.timeout = overrides.timeout;
    if (overrides.loader) result.loader = overrides.loader;
    if (overrides.isolationLevel) result.isolationLevel = overrides.isolationLevel;
    return result;
}

LoaderPtr resolveLoader(const ExecutionOptions& options) {
    if (!options.returnModel.value_or(true)) {
        return nullptr;
    }
    if (options.loader) {
        return options.loader;
    }
    return options.model;
}

Query::Query(std::string sql, Params params, ExecutionOptions options)
    : m_sql(std::move(sql))
    , m_params(std::move(params))
    , m_options(std::move(options)) {
}

Query Query::withParams(Params params) const {
    return Query(m_sql, std::move(params), m_options);
}

Query Query::executionOptions(const ExecutionOptions& options) const {
    return Query(m_sql, m_params, m_options.mergedWith(options));
}

}  // namespace sqlctx
