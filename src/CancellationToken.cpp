#include "CancellationToken.hpp"
#include "Errors.hpp"
#include <utility>

namespace sqlctx {

CancellationToken::Registration::Registration(const CancellationToken* token, uint64_t id)
    : m_token(token), m_id(id) {}

CancellationToken::Registration::~Registration() {
    reset();
}

CancellationToken::Registration::Registration(Registration&& other) noexcept
    : m_token(other.m_token), m_id(other.m_id) {
    other.m_token = nullptr;
}

CancellationToken::Registration& CancellationToken::Registration::operator=(Registration&& other) noexcept {
    if (this != &other) {
        reset();
        m_token = other.m_token;
        m_id = other.m_id;
        other.m_token = nullptr;
    }
    return *this;
}

void CancellationToken::Registration::reset() {
    if (m_token) {
        m_token->unsubscribe(m_id);
        m_token = nullptr;
    }
}

void CancellationToken::cancel() {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_cancelled.exchange(true)) {
        return;
    }
    m_dispatcher = std::this_thread::get_id();

    // One callback at a time, looked up again after every call so that
    // unsubscribed entries are skipped
    uint64_t last = 0;
    for (auto it = m_callbacks.upper_bound(last); it != m_callbacks.end(); it = m_callbacks.upper_bound(last)) {
        last = it->first;
        Callback callback = it->second;
        m_running = last;

        struct RunningGuard {
            CancellationToken* token;
            std::unique_lock<std::mutex>& lock;
            ~RunningGuard() {
                lock.lock();
                token->m_running = 0;
                token->m_idle.notify_all();
            }
        } guard{this, lock};

        // Outside the lock, callbacks may take other locks
        lock.unlock();
        callback();
    }
    m_dispatcher = std::thread::id();
}

void CancellationToken::throwIfCancelled() const {
    if (isCancelled()) {
        throw CancelledError();
    }
}

CancellationToken::Registration CancellationToken::subscribe(Callback callback) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_cancelled) {
        lock.unlock();
        callback();
        return Registration();
    }
    uint64_t id = m_nextId++;
    m_callbacks.emplace(id, std::move(callback));
    return Registration(this, id);
}

void CancellationToken::unsubscribe(uint64_t id) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_callbacks.erase(id);
    // A callback dropping its own registration must not wait for itself
    if (m_dispatcher != std::this_thread::get_id()) {
        m_idle.wait(lock, [this, id]() { return m_running != id; });
    }
}

}  // namespace sqlctx
