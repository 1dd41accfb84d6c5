#pragma once

#include <stdexcept>
#include <string>

namespace sqlctx {

class Transaction;

// Base class of every error raised by the library itself
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message);
};

// An operation needs a bound engine but none is set
class UninitializedError : public Error {
public:
    explicit UninitializedError(const std::string& message);
};

// Structural misuse: double release, closed handle, wrong release order,
// starting a transaction twice, mode mismatch, bad parameters...
class InterfaceError : public Error {
public:
    explicit InterfaceError(const std::string& message);
};

// Acquire on a pool that was closed
class PoolClosedError : public InterfaceError {
public:
    explicit PoolClosedError(const std::string& message);
};

class NoResultError : public Error {
public:
    explicit NoResultError(const std::string& message = "No row was found when one was required");
};

class MultipleResultsError : public Error {
public:
    explicit MultipleResultsError(const std::string& message = "Multiple rows were found when one or none was required");
};

// Pool wait, root lock wait or statement execution exceeded its deadline
class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string& message);
};

// The waiting task was cancelled
class CancelledError : public Error {
public:
    explicit CancelledError(const std::string& message = "Operation cancelled");
};

// Native error reported by a database driver. The library never wraps these,
// backends throw their own subclass and it reaches the caller as is.
class DriverError : public std::runtime_error {
public:
    DriverError(int code, const std::string& message, std::string sqlState = "");

    int errorCode() const { return m_errorCode; }
    const std::string& sqlState() const { return m_sqlState; }

private:
    int m_errorCode;
    std::string m_sqlState;
};

/**
 * @brief Control-flow signal raised by Transaction::raiseCommit() and
 * Transaction::raiseRollback().
 *
 * Deliberately not derived from std::exception: handlers written as
 * `catch (const std::exception&)` must not trap it. Every managed transaction
 * scope it crosses rolls back, except the target which commits or rolls back
 * as requested and stops the propagation.
 */
class TransactionBreak {
public:
    TransactionBreak(const Transaction* target, bool commit)
        : m_target(target), m_commit(commit) {}

    const Transaction* target() const { return m_target; }
    bool isCommit() const { return m_commit; }

private:
    const Transaction* m_target;
    bool m_commit;
};

}  // namespace sqlctx
