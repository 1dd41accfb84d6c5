#pragma once

/**
 * @file MySQLResultSet.hpp
 * @brief RAII wrapper for MySQL result sets.
 *
 * The MYSQL_RES handle must be freed with mysql_free_result() when no longer
 * needed. This wrapper ensures that happens and converts the text protocol
 * values of a row into typed Values by field type.
 */

#include "Value.hpp"
#include <mysql/mysql.h>
#include <string>
#include <vector>

namespace sqlctx {

/**
 * @class MySQLResultSet
 * @brief RAII wrapper for a MYSQL_RES.
 *
 * Usage:
 * @code
 *   conn.query("SELECT id, name FROM users");
 *   MySQLResultSet result(mysql_store_result(conn.get()));
 *   auto columns = result.columns();
 *   while (MYSQL_ROW row = result.fetchRow()) {
 *       Row values = result.readRow(row, columns);
 *   }
 * @endcode
 */
class MySQLResultSet {
public:
    /**
     * @brief Construct a result set wrapper.
     * @param res MYSQL_RES handle to manage (takes ownership), or nullptr.
     */
    explicit MySQLResultSet(MYSQL_RES* res = nullptr);

    /**
     * @brief Destructor - frees the MYSQL_RES handle if still owned.
     *
     * For unbuffered results this reads and discards the remaining rows.
     */
    ~MySQLResultSet();

    // Non-copyable
    MySQLResultSet(const MySQLResultSet&) = delete;
    MySQLResultSet& operator=(const MySQLResultSet&) = delete;

    // Movable
    MySQLResultSet(MySQLResultSet&& other) noexcept;
    MySQLResultSet& operator=(MySQLResultSet&& other) noexcept;

    MYSQL_RES* get() const { return m_res; }

    operator bool() const { return m_res != nullptr; }

    /**
     * @brief Fetch the next row from the result set.
     * @return MYSQL_ROW (array of char*) for the next row, or nullptr if done.
     *
     * NULL values in the result are represented as nullptr entries.
     */
    MYSQL_ROW fetchRow();

    unsigned int numFields() const;

    MYSQL_FIELD* fetchFields() const;

    // Column names shared by every row of this result
    Row::Columns columns() const;

    /**
     * @brief Convert the row last returned by fetchRow().
     *
     * Integer types become int64_t, FLOAT and DOUBLE become double, binary
     * strings and blobs become Blob, everything else (DECIMAL included)
     * stays text.
     */
    Row readRow(MYSQL_ROW row, const Row::Columns& columns) const;

    // Text form of one value to a typed Value, nullptr data is NULL
    static Value convert(const MYSQL_FIELD& field, const char* data, unsigned long length);

private:
    MYSQL_RES* m_res;  ///< MySQL result set handle (owned)
};

}  // namespace sqlctx
