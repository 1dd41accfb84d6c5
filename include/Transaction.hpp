#pragma once

/**
 * @file Transaction.hpp
 * @brief Transactions and savepoints on a connection handle.
 *
 * A transaction opened while its physical connection already is in a
 * transaction becomes a savepoint, so nested transaction scopes compose.
 *
 * Managed mode runs a body and decides the outcome from how it ends:
 * @code
 *   conn->transaction()->run([&](Transaction& tx) {
 *       conn->status("UPDATE account SET balance = balance - 10 WHERE id = 1");
 *       if (overdrawn) tx.raiseRollback();
 *   });
 * @endcode
 *
 * Manual mode leaves the outcome to the caller:
 * @code
 *   auto tx = conn->begin();
 *   conn->status("INSERT INTO audit VALUES (1)");
 *   tx->commit();
 * @endcode
 */

#include "TransactionOptions.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace sqlctx {

class Connection;

class Transaction {
public:
    enum class State {
        Uninitialized,
        Started,
        Committed,
        RolledBack,
        Failed      // Begin, commit or rollback failed at the driver
    };

    enum class Mode {
        Unset,
        Managed,
        Manual
    };

    using Body = std::function<void(Transaction&)>;

    explicit Transaction(std::shared_ptr<Connection> connection, TransactionOptions options = {});

    /**
     * @brief Destructor - rolls back a manual transaction left started.
     */
    ~Transaction();

    // Identity matters for raiseCommit()/raiseRollback(), so neither copyable nor movable
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    /**
     * @brief Begin in manual mode.
     * @throws InterfaceError if the transaction was already started.
     */
    void start();

    /**
     * @brief Begin in managed mode, run `body`, then commit or roll back.
     *
     * Normal completion commits. raiseCommit()/raiseRollback() targeting
     * this transaction end it accordingly and return normally. Any other
     * exception, including a break aimed at an outer transaction, rolls back
     * and propagates.
     *
     * @throws InterfaceError if the transaction was already started.
     */
    void run(const Body& body);

    // Manual mode only, InterfaceError otherwise
    void commit();
    void rollback();

    // Managed mode only: leave run() of this transaction, unwinding inner scopes
    [[noreturn]] void raiseCommit() const;
    [[noreturn]] void raiseRollback() const;

    State state() const { return m_state; }
    Mode mode() const { return m_mode; }
    bool isSavepoint() const { return !m_savepoint.empty(); }
    const std::string& savepointName() const { return m_savepoint; }
    const std::shared_ptr<Connection>& connection() const { return m_connection; }
    const TransactionOptions& options() const { return m_options; }

private:
    void begin();
    void finish(bool commit);
    void rollbackWhileUnwinding() noexcept;
    void checkManual(const char* operation) const;

    std::shared_ptr<Connection> m_connection;
    TransactionOptions m_options;
    State m_state = State::Uninitialized;
    Mode m_mode = Mode::Unset;
    std::string m_savepoint;    ///< Empty for a root transaction
    uint64_t m_generation = 0;  ///< Physical connection the transaction began on
};

}  // namespace sqlctx
