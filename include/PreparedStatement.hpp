#pragma once

#include "Cursor.hpp"
#include "DbConnection.hpp"
#include "Dialect.hpp"
#include "Loader.hpp"
#include "Query.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace sqlctx {

class Connection;

/**
 * @class PreparedStatement
 * @brief A query prepared once on a physical connection and run many times.
 *
 * The statement lives on the physical connection its handle held when it
 * was prepared. Once that connection goes back to the pool (a release, soft
 * or permanent), every call raises InterfaceError; a later materialization
 * of the handle does not bring the statement back.
 *
 * Parameters passed to a call replace the ones of the prepared query. Calls
 * without parameters run with the query's own.
 *
 * Usage:
 * @code
 *   auto insert = conn->prepare("INSERT INTO users (name) VALUES (:name)");
 *   for (const auto& name : names) {
 *       insert.status(Params::fromNamed({{"name", Value(name)}}));
 *   }
 * @endcode
 */
class PreparedStatement {
public:
    PreparedStatement(std::shared_ptr<Connection> connection, Query query, StatementTemplate layout,
                      uint64_t id, uint64_t generation);

    /**
     * @brief Destructor - drops the statement if its connection is still held.
     */
    ~PreparedStatement();

    // Non-copyable
    PreparedStatement(const PreparedStatement&) = delete;
    PreparedStatement& operator=(const PreparedStatement&) = delete;

    // Movable
    PreparedStatement(PreparedStatement&& other) noexcept;
    PreparedStatement& operator=(PreparedStatement&& other) noexcept;

    std::vector<Row> all(const Params& params = {});
    std::optional<Row> first(const Params& params = {});

    // @throws NoResultError, MultipleResultsError
    Row one(const Params& params = {});

    // @throws MultipleResultsError
    std::optional<Row> oneOrNone(const Params& params = {});

    // First column of the first row, NULL if there is none
    Value scalar(const Params& params = {});

    QueryResult status(const Params& params = {});

    /**
     * @brief Stream the rows of one execution.
     * @throws InterfaceError unless a transaction is open on the connection.
     */
    Cursor iterate(const Params& params = {});

    template <typename T>
    std::vector<T> allAs(const Params& params = {}) {
        std::vector<T> result;
        for (const auto& row : all(params)) {
            result.push_back(loadAs<T>(row, m_loader));
        }
        return result;
    }

    template <typename T>
    std::optional<T> firstAs(const Params& params = {}) {
        auto row = first(params);
        if (!row) return std::nullopt;
        return loadAs<T>(*row, m_loader);
    }

    const Query& query() const { return m_query; }

    // SQL as sent to the server, in the dialect's parameter style
    const std::string& compiledSql() const { return m_layout.sql; }

    void close();
    bool isClosed() const { return m_connection == nullptr; }

private:
    // Run fn on the driver statement with the root locked and validated
    template <typename Fn>
    auto withStatement(Deadline deadline, Fn&& fn)
        -> decltype(fn(std::declval<DbConnection&>(), std::declval<DbPreparedStatement&>()));

    QueryResult execute(const Params& params);
    std::vector<Value> bind(const Params& params) const;
    void closeQuietly() noexcept;

    std::shared_ptr<Connection> m_connection;
    Query m_query;
    StatementTemplate m_layout;
    uint64_t m_id;
    uint64_t m_generation;
    ExecutionOptions m_options;
    LoaderPtr m_loader;
};

}  // namespace sqlctx
