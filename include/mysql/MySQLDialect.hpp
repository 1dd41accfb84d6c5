#pragma once

#include "Dialect.hpp"

namespace sqlctx {

/**
 * @class MySQLDialect
 * @brief `?` placeholders, `START TRANSACTION` with a separate
 * `SET TRANSACTION ISOLATION LEVEL` for non-default isolation.
 *
 * Deferrable is PostgreSQL only and ignored here.
 */
class MySQLDialect : public Dialect {
public:
    std::string name() const override { return "mysql"; }
    ParamStyle paramStyle() const override { return ParamStyle::Qmark; }

    std::vector<std::string> beginStatements(const TransactionOptions& options) const override;

    std::unique_ptr<DbConnection> connect(const ConnectionConfig& config) const override;

protected:
    // Backslash escapes inside quoted strings, `#` line comments
    size_t skipLiteral(const std::string& sql, size_t pos) const override;
};

}  // namespace sqlctx
