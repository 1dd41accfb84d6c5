#include "SQLiteDialect.hpp"
#include "SQLiteConnection.hpp"
#include "Config.hpp"

namespace sqlctx {

std::vector<std::string> SQLiteDialect::beginStatements(const TransactionOptions& options) const {
    if (options.isolation == IsolationLevel::Serializable) {
        return {"BEGIN IMMEDIATE"};
    }
    return {"BEGIN"};
}

std::unique_ptr<DbConnection> SQLiteDialect::connect(const ConnectionConfig& config) const {
    return std::make_unique<SQLiteConnection>(config.database, config.connect_timeout);
}

}  // namespace sqlctx
