#pragma once

/**
 * @file ExecutionContext.hpp
 * @brief Task-local storage of connection stacks.
 *
 * Every thread runs inside an ExecutionContext. A context keeps, for each
 * engine, the stack of reusable connection handles acquired by the task, so
 * that nested code can find and reuse the latest one without passing it
 * around. Tasks started with spawn() run in a fork of the spawning context:
 * they see the connections acquired so far, but their own acquisitions stay
 * invisible to the parent and vice versa.
 */

#include "CancellationToken.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace sqlctx {

class Connection;
using ConnectionPtr = std::shared_ptr<Connection>;

enum class RemovalOrder {
    Lifo,  // The entry must be the top open entry of its stack
    Any    // The entry may be anywhere in its stack
};

/**
 * @class ConnectionStack
 * @brief Ordered connection handles of one engine in one context.
 *
 * Not synchronized, the owning ExecutionContext serializes access.
 */
class ConnectionStack {
public:
    void push(ConnectionPtr connection);

    // Most recent open handle, after dropping closed handles from the top
    ConnectionPtr top();

    /**
     * @brief Remove the first handle (from the top) matching the predicate.
     * @throws InterfaceError if no handle matches, or with RemovalOrder::Lifo
     *         when the match is not the top open handle.
     */
    void remove(const std::function<bool(const Connection&)>& predicate, RemovalOrder order);

    bool empty() const { return m_entries.empty(); }
    size_t size() const { return m_entries.size(); }
    const std::vector<ConnectionPtr>& entries() const { return m_entries; }

private:
    void pruneClosed();

    std::vector<ConnectionPtr> m_entries;  ///< Bottom to top
};

class ExecutionContext : public std::enable_shared_from_this<ExecutionContext> {
public:
    using Key = uint64_t;

    static std::shared_ptr<ExecutionContext> create();

    // Context bound to the calling thread, created on first use
    static std::shared_ptr<ExecutionContext> current();

    // Fresh key for a new engine
    static Key newKey();

    /**
     * @brief Copy of this context for a child task.
     *
     * Stacks are copied entry by entry into new stack objects, so pushes and
     * removals on either side stay local. The child gets its own
     * cancellation token.
     */
    std::shared_ptr<ExecutionContext> fork() const;

    // Stack of `key`, created empty if missing
    std::shared_ptr<ConnectionStack> getOrCreateStack(Key key);

    // Stack of `key`, or nullptr
    std::shared_ptr<ConnectionStack> stack(Key key) const;

    // Push onto the stack of `key`, creating it on first use
    void push(Key key, ConnectionPtr connection);

    // Top open handle of the stack of `key`, or nullptr
    ConnectionPtr top(Key key);

    /**
     * @brief Remove a handle from the stack of `key`.
     *
     * The key is cleared when its stack becomes empty.
     * @throws InterfaceError if there is no such handle, or on wrong release
     *         order with RemovalOrder::Lifo.
     */
    void removeFromStack(Key key, const std::function<bool(const Connection&)>& predicate,
                         RemovalOrder order);

    bool hasStack(Key key) const;
    size_t stackSize(Key key) const;

    const CancellationTokenPtr& cancellationToken() const { return m_token; }

private:
    ExecutionContext();

    std::shared_ptr<ConnectionStack>& stackLocked(Key key);

    mutable std::mutex m_mutex;
    std::map<Key, std::shared_ptr<ConnectionStack>> m_stacks;
    CancellationTokenPtr m_token;

    static thread_local std::shared_ptr<ExecutionContext> s_current;

    friend class ContextScope;
};

/**
 * @class ContextScope
 * @brief Binds a context to the current thread for the scope lifetime.
 */
class ContextScope {
public:
    explicit ContextScope(std::shared_ptr<ExecutionContext> context);
    ~ContextScope();

    ContextScope(const ContextScope&) = delete;
    ContextScope& operator=(const ContextScope&) = delete;

private:
    std::shared_ptr<ExecutionContext> m_previous;
};

}  // namespace sqlctx
