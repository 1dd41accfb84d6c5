#pragma once

#include "Dialect.hpp"

namespace sqlctx {

/**
 * @class PostgreSQLDialect
 * @brief `$n` placeholders and `BEGIN ISOLATION LEVEL ...` transactions.
 */
class PostgreSQLDialect : public Dialect {
public:
    std::string name() const override { return "postgresql"; }
    ParamStyle paramStyle() const override { return ParamStyle::Numeric; }

    // BEGIN [ISOLATION LEVEL x] [READ ONLY] [DEFERRABLE]
    std::vector<std::string> beginStatements(const TransactionOptions& options) const override;

    std::unique_ptr<DbConnection> connect(const ConnectionConfig& config) const override;

protected:
    // E'...' escape strings and $tag$...$tag$ dollar quoting
    size_t skipLiteral(const std::string& sql, size_t pos) const override;
};

}  // namespace sqlctx
