#pragma once

#include "Dialect.hpp"

namespace sqlctx {

/**
 * @class SQLiteDialect
 * @brief `?` placeholders, `BEGIN` / `BEGIN IMMEDIATE`, files as databases.
 *
 * SQLite has no isolation levels: every transaction is serializable. A
 * transaction asking for Serializable begins IMMEDIATE so that it takes the
 * write lock up front; other levels and read only are accepted and ignored.
 */
class SQLiteDialect : public Dialect {
public:
    std::string name() const override { return "sqlite"; }
    ParamStyle paramStyle() const override { return ParamStyle::Qmark; }

    std::vector<std::string> beginStatements(const TransactionOptions& options) const override;

    // Opens ConnectionConfig::database, using connect_timeout as busy timeout
    std::unique_ptr<DbConnection> connect(const ConnectionConfig& config) const override;
};

}  // namespace sqlctx
