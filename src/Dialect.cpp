#include "Dialect.hpp"
#include "Errors.hpp"
#include "SQLiteDialect.hpp"
#ifdef SQLCTX_HAVE_POSTGRESQL
#include "PostgreSQLDialect.hpp"
#endif
#ifdef SQLCTX_HAVE_MYSQL
#include "MySQLDialect.hpp"
#endif
#include <algorithm>
#include <cctype>

namespace sqlctx {

namespace {

bool isIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string normalizeName(const std::string& name) {
    std::string result;
    for (char c : name) {
        if (c == '_' || c == '-' || c == ' ') continue;
        result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

}  // namespace

std::string toString(IsolationLevel level) {
    switch (level) {
        case IsolationLevel::ReadUncommitted: return "READ UNCOMMITTED";
        case IsolationLevel::ReadCommitted: return "READ COMMITTED";
        case IsolationLevel::RepeatableRead: return "REPEATABLE READ";
        case IsolationLevel::Serializable: return "SERIALIZABLE";
    }
    return "READ COMMITTED";
}

std::optional<IsolationLevel> parseIsolationLevel(const std::string& name) {
    std::string normalized = normalizeName(name);
    if (normalized == "READUNCOMMITTED") return IsolationLevel::ReadUncommitted;
    if (normalized == "READCOMMITTED") return IsolationLevel::ReadCommitted;
    if (normalized == "REPEATABLEREAD") return IsolationLevel::RepeatableRead;
    if (normalized == "SERIALIZABLE") return IsolationLevel::Serializable;
    return std::nullopt;
}

// ============================================================================
// Placeholder compilation
// ============================================================================

std::vector<Value> StatementTemplate::bind(const Params& params) const {
    if (positionalCount != params.positional.size()) {
        throw InterfaceError("Statement uses " + std::to_string(positionalCount) +
                             " positional parameters but " +
                             std::to_string(params.positional.size()) + " were given");
    }

    std::vector<Value> values;
    values.reserve(slots.size());
    size_t positionalUsed = 0;
    for (const auto& slot : slots) {
        if (slot.empty()) {
            values.push_back(params.positional[positionalUsed++]);
            continue;
        }
        auto it = params.named.find(slot);
        if (it == params.named.end()) {
            throw InterfaceError("Missing value for named parameter '" + slot + "'");
        }
        values.push_back(it->second);
    }
    return values;
}

StatementTemplate Dialect::parse(const std::string& sql) const {
    const ParamStyle style = paramStyle();

    StatementTemplate result;
    result.sql.reserve(sql.size());

    auto emitPlaceholder = [&](std::string name) {
        if (name.empty()) ++result.positionalCount;
        result.slots.push_back(std::move(name));
        if (style == ParamStyle::Numeric) {
            result.sql += '$';
            result.sql += std::to_string(result.slots.size());
        } else {
            result.sql += '?';
        }
    };

    size_t i = 0;
    while (i < sql.size()) {
        // Strings, quoted identifiers and comments are copied verbatim
        size_t end = skipLiteral(sql, i);
        if (end > i) {
            result.sql.append(sql, i, end - i);
            i = end;
            continue;
        }

        char c = sql[i];
        if (c == '?') {
            emitPlaceholder(std::string());
            ++i;
            continue;
        }

        if (c == ':') {
            // :: cast, keep both colons
            if (i + 1 < sql.size() && sql[i + 1] == ':') {
                result.sql += "::";
                i += 2;
                continue;
            }
            bool afterIdentifier = i > 0 && isIdentifierChar(sql[i - 1]);
            if (!afterIdentifier && i + 1 < sql.size() && isIdentifierStart(sql[i + 1])) {
                end = i + 1;
                while (end < sql.size() && isIdentifierChar(sql[end])) ++end;
                emitPlaceholder(sql.substr(i + 1, end - i - 1));
                i = end;
                continue;
            }
        }

        result.sql += c;
        ++i;
    }

    return result;
}

CompiledStatement Dialect::compile(const Query& query) const {
    StatementTemplate layout = parse(query.sql());

    CompiledStatement result;
    result.params = layout.bind(query.params());
    result.sql = std::move(layout.sql);
    return result;
}

size_t Dialect::skipLiteral(const std::string& sql, size_t pos) const {
    char c = sql[pos];
    if (c == '\'' || c == '"' || c == '`') {
        return skipQuoted(sql, pos, false);
    }
    if (c == '-' && pos + 1 < sql.size() && sql[pos + 1] == '-') {
        return skipLineComment(sql, pos);
    }
    if (c == '/' && pos + 1 < sql.size() && sql[pos + 1] == '*') {
        size_t end = sql.find("*/", pos + 2);
        return (end == std::string::npos) ? sql.size() : end + 2;
    }
    return pos;
}

size_t Dialect::skipQuoted(const std::string& sql, size_t pos, bool backslashEscapes) {
    const char quote = sql[pos];
    size_t end = pos + 1;
    while (end < sql.size()) {
        if (backslashEscapes && sql[end] == '\\') {
            end += 2;
            continue;
        }
        if (sql[end] == quote) {
            // Doubled quote stays inside the literal
            if (end + 1 < sql.size() && sql[end + 1] == quote) {
                end += 2;
                continue;
            }
            return end + 1;
        }
        ++end;
    }
    return sql.size();
}

size_t Dialect::skipLineComment(const std::string& sql, size_t pos) {
    size_t end = sql.find('\n', pos);
    return (end == std::string::npos) ? sql.size() : end;
}

// ============================================================================
// Transaction statements
// ============================================================================

std::vector<std::string> Dialect::beginStatements(const TransactionOptions&) const {
    return {"BEGIN"};
}

std::string Dialect::savepointStatement(const std::string& name) const {
    return "SAVEPOINT " + name;
}

std::string Dialect::releaseSavepointStatement(const std::string& name) const {
    return "RELEASE SAVEPOINT " + name;
}

std::string Dialect::rollbackToSavepointStatement(const std::string& name) const {
    return "ROLLBACK TO SAVEPOINT " + name;
}

// ============================================================================
// Registry
// ============================================================================

DialectPtr createDialect(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "sqlite" || lower == "sqlite3") {
        return std::make_shared<SQLiteDialect>();
    }
    if (lower == "postgresql" || lower == "postgres") {
#ifdef SQLCTX_HAVE_POSTGRESQL
        return std::make_shared<PostgreSQLDialect>();
#else
        throw InterfaceError("PostgreSQL support was not compiled in");
#endif
    }
    if (lower == "mysql" || lower == "mariadb") {
#ifdef SQLCTX_HAVE_MYSQL
        return std::make_shared<MySQLDialect>();
#else
        throw InterfaceError("MySQL support was not compiled in");
#endif
    }
    throw InterfaceError("Unsupported database type: " + name);
}

}  // namespace sqlctx
