#include "PostgreSQLDialect.hpp"
#include "PostgreSQLConnection.hpp"
#include "Config.hpp"
#include <cctype>

namespace sqlctx {

namespace {

bool isTagChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

}  // namespace

std::vector<std::string> PostgreSQLDialect::beginStatements(const TransactionOptions& options) const {
    std::string sql = "BEGIN";
    if (options.isolation) {
        sql += " ISOLATION LEVEL " + toString(*options.isolation);
    }
    if (options.readOnly) {
        sql += " READ ONLY";
    }
    if (options.deferrable) {
        sql += " DEFERRABLE";
    }
    return {sql};
}

size_t PostgreSQLDialect::skipLiteral(const std::string& sql, size_t pos) const {
    char c = sql[pos];

    // E'...' only when the E is not the tail of an identifier
    if ((c == 'E' || c == 'e') && pos + 1 < sql.size() && sql[pos + 1] == '\'' &&
        (pos == 0 || !isTagChar(sql[pos - 1]))) {
        return skipQuoted(sql, pos + 1, true);
    }

    // $$...$$ or $tag$...$tag$; a tag never starts with a digit, so $1 is not one
    if (c == '$' && (pos == 0 || !isTagChar(sql[pos - 1]))) {
        size_t tagEnd = pos + 1;
        if (tagEnd < sql.size() && std::isdigit(static_cast<unsigned char>(sql[tagEnd]))) {
            return pos;
        }
        while (tagEnd < sql.size() && isTagChar(sql[tagEnd])) ++tagEnd;
        if (tagEnd < sql.size() && sql[tagEnd] == '$') {
            std::string tag = sql.substr(pos, tagEnd - pos + 1);
            size_t close = sql.find(tag, tagEnd + 1);
            return (close == std::string::npos) ? sql.size() : close + tag.size();
        }
        return pos;
    }

    return Dialect::skipLiteral(sql, pos);
}

std::unique_ptr<DbConnection> PostgreSQLDialect::connect(const ConnectionConfig& config) const {
    return std::make_unique<PostgreSQLConnection>(config);
}

}  // namespace sqlctx
