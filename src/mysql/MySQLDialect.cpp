#include "MySQLDialect.hpp"
#include "MySQLConnection.hpp"

namespace sqlctx {

std::vector<std::string> MySQLDialect::beginStatements(const TransactionOptions& options) const {
    std::vector<std::string> statements;
    if (options.isolation) {
        // Applies to the next transaction only
        statements.push_back("SET TRANSACTION ISOLATION LEVEL " + toString(*options.isolation));
    }
    statements.push_back(options.readOnly ? "START TRANSACTION READ ONLY" : "START TRANSACTION");
    return statements;
}

size_t MySQLDialect::skipLiteral(const std::string& sql, size_t pos) const {
    char c = sql[pos];
    if (c == '\'' || c == '"') {
        return skipQuoted(sql, pos, true);
    }
    if (c == '#') {
        return skipLineComment(sql, pos);
    }
    return Dialect::skipLiteral(sql, pos);
}

std::unique_ptr<DbConnection> MySQLDialect::connect(const ConnectionConfig& config) const {
    return std::make_unique<MySQLConnection>(config);
}

}  // namespace sqlctx
