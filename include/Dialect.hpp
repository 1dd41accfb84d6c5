#pragma once

/**
 * @file Dialect.hpp
 * @brief Per-backend SQL flavor: placeholder style, transaction statements
 * and the factory for physical connections.
 */

#include "Query.hpp"
#include "TransactionOptions.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlctx {

struct ConnectionConfig;
class DbConnection;

enum class ParamStyle {
    Qmark,    // ?
    Numeric   // $1, $2, ...
};

/**
 * @struct StatementTemplate
 * @brief SQL already rewritten to a dialect's placeholders, values unbound.
 *
 * Prepared statements keep one of these and bind fresh parameters on every
 * execution.
 */
struct StatementTemplate {
    std::string sql;
    std::vector<std::string> slots;  // per placeholder: parameter name, empty for positional
    size_t positionalCount = 0;

    /**
     * @brief Values in placeholder order.
     * @throws InterfaceError if a named parameter is missing or the number
     *         of positional parameters does not match.
     */
    std::vector<Value> bind(const Params& params) const;
};

/**
 * @class Dialect
 * @brief Abstract SQL dialect.
 *
 * Dialects are stateless and shared between an engine, its pool and every
 * connection handle through DialectPtr.
 */
class Dialect {
public:
    virtual ~Dialect() = default;

    // Non-copyable
    Dialect(const Dialect&) = delete;
    Dialect& operator=(const Dialect&) = delete;

    virtual std::string name() const = 0;
    virtual ParamStyle paramStyle() const = 0;

    /**
     * @brief Rewrite the placeholders of a query into this dialect's style.
     *
     * `?` takes the next positional parameter, `:name` takes the named
     * parameter `name`. Placeholders inside quoted strings, quoted
     * identifiers and comments are left alone, as are `::` casts.
     *
     * @throws InterfaceError if a named parameter is missing or the number
     *         of positional parameters does not match the placeholders.
     */
    CompiledStatement compile(const Query& query) const;

    // Placeholder layout of `sql` without binding any values
    StatementTemplate parse(const std::string& sql) const;

    /**
     * @brief Statements that open a root transaction.
     *
     * Usually a single statement; MySQL needs `SET TRANSACTION` before
     * `START TRANSACTION` to change the isolation level.
     */
    virtual std::vector<std::string> beginStatements(const TransactionOptions& options) const;

    virtual std::string commitStatement() const { return "COMMIT"; }
    virtual std::string rollbackStatement() const { return "ROLLBACK"; }
    virtual std::string savepointStatement(const std::string& name) const;
    virtual std::string releaseSavepointStatement(const std::string& name) const;
    virtual std::string rollbackToSavepointStatement(const std::string& name) const;

    /**
     * @brief Open a new physical connection.
     * @throws DriverError subclass if the server cannot be reached.
     */
    virtual std::unique_ptr<DbConnection> connect(const ConnectionConfig& config) const = 0;

protected:
    Dialect() = default;

    /**
     * @brief End of the string literal, quoted identifier or comment that
     * starts at `pos`.
     *
     * The base recognizes standard quoting with doubled quotes, `--` and
     * block comments. Dialects add their own lexical forms.
     *
     * @return Position just past it, or `pos` when none starts there.
     */
    virtual size_t skipLiteral(const std::string& sql, size_t pos) const;

    static size_t skipQuoted(const std::string& sql, size_t pos, bool backslashEscapes);
    static size_t skipLineComment(const std::string& sql, size_t pos);
};

using DialectPtr = std::shared_ptr<const Dialect>;

/**
 * @brief Dialect registered under a backend name.
 *
 * Known names: sqlite, postgresql (alias postgres), mysql. Backends that were
 * not compiled in are reported as unsupported.
 *
 * @throws InterfaceError for unknown or unsupported names.
 */
DialectPtr createDialect(const std::string& name);

}  // namespace sqlctx
