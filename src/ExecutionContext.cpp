#include "ExecutionContext.hpp"
#include "Connection.hpp"
#include "Errors.hpp"
#include <atomic>

namespace sqlctx {

thread_local std::shared_ptr<ExecutionContext> ExecutionContext::s_current;

// ============================================================================
// ConnectionStack
// ============================================================================

void ConnectionStack::push(ConnectionPtr connection) {
    m_entries.push_back(std::move(connection));
}

void ConnectionStack::pruneClosed() {
    // Entries inherited from a parent task may have been released there
    while (!m_entries.empty() && m_entries.back()->isClosed()) {
        m_entries.pop_back();
    }
}

ConnectionPtr ConnectionStack::top() {
    pruneClosed();
    return m_entries.empty() ? nullptr : m_entries.back();
}

void ConnectionStack::remove(const std::function<bool(const Connection&)>& predicate, RemovalOrder order) {
    for (auto it = m_entries.rbegin(); it != m_entries.rend(); ++it) {
        if (!predicate(**it)) {
            continue;
        }
        if (order == RemovalOrder::Lifo) {
            for (auto above = m_entries.rbegin(); above != it; ++above) {
                if (!(*above)->isClosed()) {
                    throw InterfaceError("Connection released in the wrong order: "
                                         "release the most recently acquired connection first");
                }
            }
        }
        m_entries.erase(std::next(it).base());
        pruneClosed();
        return;
    }
    throw InterfaceError("Connection is not in the context stack");
}

// ============================================================================
// ExecutionContext
// ============================================================================

ExecutionContext::ExecutionContext()
    : m_token(std::make_shared<CancellationToken>()) {}

std::shared_ptr<ExecutionContext> ExecutionContext::create() {
    return std::shared_ptr<ExecutionContext>(new ExecutionContext());
}

std::shared_ptr<ExecutionContext> ExecutionContext::current() {
    if (!s_current) {
        s_current = create();
    }
    return s_current;
}

ExecutionContext::Key ExecutionContext::newKey() {
    static std::atomic<Key> nextKey{1};
    return nextKey++;
}

std::shared_ptr<ExecutionContext> ExecutionContext::fork() const {
    auto child = create();
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [key, stack] : m_stacks) {
        child->m_stacks.emplace(key, std::make_shared<ConnectionStack>(*stack));
    }
    return child;
}

std::shared_ptr<ConnectionStack>& ExecutionContext::stackLocked(Key key) {
    auto& stack = m_stacks[key];
    if (!stack) {
        stack = std::make_shared<ConnectionStack>();
    }
    return stack;
}

std::shared_ptr<ConnectionStack> ExecutionContext::getOrCreateStack(Key key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return stackLocked(key);
}

std::shared_ptr<ConnectionStack> ExecutionContext::stack(Key key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_stacks.find(key);
    return it == m_stacks.end() ? nullptr : it->second;
}

void ExecutionContext::push(Key key, ConnectionPtr connection) {
    std::lock_guard<std::mutex> lock(m_mutex);
    stackLocked(key)->push(std::move(connection));
}

ConnectionPtr ExecutionContext::top(Key key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_stacks.find(key);
    if (it == m_stacks.end()) {
        return nullptr;
    }
    auto connection = it->second->top();
    if (it->second->empty()) {
        m_stacks.erase(it);
    }
    return connection;
}

void ExecutionContext::removeFromStack(Key key, const std::function<bool(const Connection&)>& predicate,
                                       RemovalOrder order) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_stacks.find(key);
    if (it == m_stacks.end()) {
        throw InterfaceError("Connection is not in the context stack");
    }
    it->second->remove(predicate, order);
    if (it->second->empty()) {
        m_stacks.erase(it);
    }
}

bool ExecutionContext::hasStack(Key key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stacks.count(key) > 0;
}

size_t ExecutionContext::stackSize(Key key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_stacks.find(key);
    return it == m_stacks.end() ? 0 : it->second->size();
}

// ============================================================================
// ContextScope
// ============================================================================

ContextScope::ContextScope(std::shared_ptr<ExecutionContext> context)
    : m_previous(ExecutionContext::s_current) {
    ExecutionContext::s_current = std::move(context);
}

ContextScope::~ContextScope() {
    ExecutionContext::s_current = std::move(m_previous);
}

}  // namespace sqlctx
