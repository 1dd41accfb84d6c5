#include "Transaction.hpp"
#include "Connection.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <exception>

namespace sqlctx {

Transaction::Transaction(std::shared_ptr<Connection> connection, TransactionOptions options)
    : m_connection(std::move(connection)), m_options(options) {
    if (!m_connection) {
        throw InterfaceError("Transaction requires a connection");
    }
}

Transaction::~Transaction() {
    if (m_mode == Mode::Manual && m_state == State::Started) {
        try {
            finish(false);
            spdlog::debug("Manual transaction rolled back on destruction");
        } catch (const std::exception& e) {
            spdlog::error("Failed to roll back abandoned transaction: {}", e.what());
        }
    }
}

// ============================================================================
// Begin
// ============================================================================

void Transaction::begin() {
    try {
        auto lease = m_connection->leaseRaw(m_connection->acquireDeadline(std::nullopt));
        DbConnection& raw = *lease.raw;
        const Dialect& dialect = *m_connection->dialect();

        if (raw.inTransaction()) {
            m_savepoint = raw.nextSavepointName();
            if (!m_options.isDefault()) {
                spdlog::debug("Transaction options ignored for savepoint {}", m_savepoint);
            }
            raw.execute(CompiledStatement{dialect.savepointStatement(m_savepoint), {}});
            spdlog::debug("Savepoint {} created", m_savepoint);
        } else {
            TransactionOptions options = m_options;
            if (!options.isolation) {
                options.isolation = m_connection->executionOptions().isolationLevel;
            }
            for (const auto& sql : dialect.beginStatements(options)) {
                raw.execute(CompiledStatement{sql, {}});
            }
            spdlog::debug("Transaction started");
        }
        m_generation = lease.generation;
    } catch (...) {
        m_state = State::Failed;
        throw;
    }
    m_state = State::Started;
}

void Transaction::start() {
    if (m_mode != Mode::Unset) {
        throw InterfaceError("Transaction already started");
    }
    m_mode = Mode::Manual;
    begin();
}

// ============================================================================
// Managed mode
// ============================================================================

void Transaction::run(const Body& body) {
    if (m_mode != Mode::Unset) {
        throw InterfaceError("Transaction already started");
    }
    m_mode = Mode::Managed;
    begin();

    try {
        body(*this);
    } catch (const TransactionBreak& signal) {
        if (signal.target() != this) {
            rollbackWhileUnwinding();
            throw;
        }
        finish(signal.isCommit());
        return;
    } catch (...) {
        rollbackWhileUnwinding();
        throw;
    }

    finish(true);
}

void Transaction::raiseCommit() const {
    if (m_mode != Mode::Managed || m_state != State::Started) {
        throw InterfaceError("raiseCommit() is only allowed inside a running managed transaction");
    }
    throw TransactionBreak(this, true);
}

void Transaction::raiseRollback() const {
    if (m_mode != Mode::Managed || m_state != State::Started) {
        throw InterfaceError("raiseRollback() is only allowed inside a running managed transaction");
    }
    throw TransactionBreak(this, false);
}

void Transaction::rollbackWhileUnwinding() noexcept {
    if (m_state != State::Started) {
        return;
    }
    try {
        finish(false);
    } catch (const std::exception& e) {
        // The exception being unwound wins
        spdlog::error("Rollback failed while unwinding: {}", e.what());
    }
}

// ============================================================================
// Manual mode
// ============================================================================

void Transaction::checkManual(const char* operation) const {
    if (m_mode == Mode::Managed) {
        throw InterfaceError(std::string(operation) +
                             "() is not allowed in a managed transaction, use raiseCommit() or raiseRollback()");
    }
    if (m_mode == Mode::Unset) {
        throw InterfaceError("Transaction not started");
    }
}

void Transaction::commit() {
    checkManual("commit");
    finish(true);
}

void Transaction::rollback() {
    checkManual("rollback");
    finish(false);
}

// ============================================================================
// Commit / Rollback
// ============================================================================

void Transaction::finish(bool commit) {
    if (m_state != State::Started) {
        throw InterfaceError("Transaction is not active");
    }

    auto lease = m_connection->leaseRaw(m_connection->acquireDeadline(std::nullopt), false);
    if (!lease.raw || lease.generation != m_generation) {
        m_state = State::Failed;
        throw InterfaceError("The physical connection of this transaction was released");
    }

    DbConnection& raw = *lease.raw;
    const Dialect& dialect = *m_connection->dialect();
    try {
        if (m_savepoint.empty()) {
            raw.execute(CompiledStatement{commit ? dialect.commitStatement() : dialect.rollbackStatement(), {}});
        } else if (commit) {
            raw.execute(CompiledStatement{dialect.releaseSavepointStatement(m_savepoint), {}});
        } else {
            raw.execute(CompiledStatement{dialect.rollbackToSavepointStatement(m_savepoint), {}});
            raw.execute(CompiledStatement{dialect.releaseSavepointStatement(m_savepoint), {}});
        }
    } catch (...) {
        m_state = State::Failed;
        throw;
    }

    m_state = commit ? State::Committed : State::RolledBack;
    if (m_savepoint.empty()) {
        spdlog::debug("Transaction {}", commit ? "committed" : "rolled back");
    } else {
        spdlog::debug("Savepoint {} {}", m_savepoint, commit ? "released" : "rolled back");
    }
}

}  // namespace sqlctx
