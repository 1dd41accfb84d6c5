#pragma once

/**
 * @file PostgreSQLResultSet.hpp
 * @brief RAII wrapper for PostgreSQL query results.
 *
 * PostgreSQL's libpq returns a PGresult* handle for every query. The result
 * must be freed with PQclear() when no longer needed. This wrapper ensures
 * automatic cleanup and converts text-format values into typed Values by
 * column type Oid.
 */

#include "Value.hpp"
#include <libpq-fe.h>
#include <string>
#include <vector>
#include <cstdint>

namespace sqlctx {

/**
 * @class PostgreSQLResultSet
 * @brief RAII wrapper for a PGresult.
 *
 * Usage:
 * @code
 *   PostgreSQLResultSet result(PQexec(conn, "SELECT id, name FROM users"));
 *   auto columns = result.columns();
 *   for (int i = 0; i < result.numRows(); ++i) {
 *       Row row = result.readRow(i, columns);
 *   }
 * @endcode
 */
class PostgreSQLResultSet {
public:
    /**
     * @brief Construct a result set wrapper.
     * @param res PGresult handle to manage (takes ownership), or nullptr.
     */
    explicit PostgreSQLResultSet(PGresult* res = nullptr);

    ~PostgreSQLResultSet();

    // Non-copyable
    PostgreSQLResultSet(const PostgreSQLResultSet&) = delete;
    PostgreSQLResultSet& operator=(const PostgreSQLResultSet&) = delete;

    // Movable
    PostgreSQLResultSet(PostgreSQLResultSet&& other) noexcept;
    PostgreSQLResultSet& operator=(PostgreSQLResultSet&& other) noexcept;

    PGresult* get() const { return m_res; }

    // ----- Status checking -----

    /**
     * @brief Check if the result status indicates success.
     * @return true if status is PGRES_TUPLES_OK or PGRES_COMMAND_OK.
     */
    bool isOk() const;

    ExecStatusType status() const;
    const char* errorMessage() const;

    // Five character SQLSTATE of a failed result, empty otherwise
    std::string sqlState() const;

    // Command tag, e.g. "INSERT 0 1", "UPDATE 3", "SELECT 2"
    std::string commandStatus() const;

    /**
     * @brief Rows affected by the command.
     *
     * Parses the string from PQcmdTuples(); 0 for commands without a count.
     */
    uint64_t affectedRows() const;

    // ----- Row and column counts -----

    int numFields() const;
    int numRows() const;

    // ----- Value access -----

    bool isNull(int row, int col) const;

    /**
     * @brief Get a value converted by its column type.
     *
     * Common Oids: 16=bool, 20/21/23=int8/int2/int4, 700/701=float4/float8,
     * 17=bytea. Everything else (numeric included) stays text.
     */
    Value value(int row, int col) const;

    Row readRow(int row, const Row::Columns& columns) const;

    // ----- Column metadata -----

    Oid fieldType(int col) const;

    // Column names shared by every row of this result
    Row::Columns columns() const;

    // ----- Resource management -----

    /**
     * @brief Reset the wrapper with a new result.
     *
     * Clears the current result first if any.
     */
    void reset(PGresult* res = nullptr);

private:
    PGresult* m_res;  ///< PostgreSQL result handle (owned)
};

}  // namespace sqlctx
