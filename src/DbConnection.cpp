#include "DbConnection.hpp"
#include <spdlog/spdlog.h>
#include <exception>

namespace sqlctx {

namespace {

// Prepared statement for drivers without a native one
class ReissuedStatement : public DbPreparedStatement {
public:
    ReissuedStatement(DbConnection& connection, std::string sql)
        : m_connection(connection), m_sql(std::move(sql)) {}

    QueryResult execute(const std::vector<Value>& params, Deadline deadline) override {
        return m_connection.execute(CompiledStatement{m_sql, params}, deadline);
    }

    std::unique_ptr<DbCursor> openCursor(const std::vector<Value>& params) override {
        return m_connection.openCursor(CompiledStatement{m_sql, params});
    }

private:
    DbConnection& m_connection;
    std::string m_sql;
};

}  // namespace

std::vector<Row> DbCursor::fetchMany(size_t count) {
    std::vector<Row> rows;
    while (rows.size() < count) {
        auto row = fetchOne();
        if (!row) break;
        rows.push_back(std::move(*row));
    }
    return rows;
}

size_t DbCursor::skip(size_t count) {
    size_t skipped = 0;
    while (skipped < count && fetchOne()) {
        ++skipped;
    }
    return skipped;
}

void DbConnection::reset() {
    if (inTransaction()) {
        execute(CompiledStatement{"ROLLBACK", {}});
    }
}

std::string DbConnection::nextSavepointName() {
    return "sqlctx_sp_" + std::to_string(++m_savepointCounter);
}

// ============================================================================
// Prepared statements
// ============================================================================

uint64_t DbConnection::prepare(const std::string& sql) {
    std::unique_ptr<DbPreparedStatement> statement = prepareStatement(sql);
    uint64_t id = ++m_preparedCounter;
    m_prepared.emplace(id, std::move(statement));
    return id;
}

DbPreparedStatement* DbConnection::prepared(uint64_t id) const {
    auto it = m_prepared.find(id);
    return it == m_prepared.end() ? nullptr : it->second.get();
}

void DbConnection::closePrepared(uint64_t id) {
    auto it = m_prepared.find(id);
    if (it == m_prepared.end()) {
        return;
    }
    std::unique_ptr<DbPreparedStatement> statement = std::move(it->second);
    m_prepared.erase(it);
    statement->close();
}

void DbConnection::closeAllPrepared() noexcept {
    auto prepared = std::move(m_prepared);
    m_prepared.clear();
    for (auto& entry : prepared) {
        try {
            entry.second->close();
        } catch (const std::exception& e) {
            spdlog::warn("Failed to close prepared statement {}: {}", entry.first, e.what());
        }
    }
}

std::unique_ptr<DbPreparedStatement> DbConnection::prepareStatement(const std::string& sql) {
    return std::make_unique<ReissuedStatement>(*this, sql);
}

}  // namespace sqlctx
