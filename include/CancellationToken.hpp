#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace sqlctx {

/**
 * @class CancellationToken
 * @brief Cooperative cancellation flag shared by a task and its waiters.
 *
 * Blocking operations (pool waits) subscribe a callback that wakes them up;
 * the callback runs on the thread calling cancel(), or immediately on
 * subscription when the token is already cancelled.
 *
 * Once a Registration is destroyed its callback never starts again, and
 * destruction blocks while that callback is running on another thread.
 */
class CancellationToken {
public:
    using Callback = std::function<void()>;

    /**
     * @class Registration
     * @brief RAII subscription, unsubscribes on destruction.
     */
    class Registration {
    public:
        Registration() = default;
        Registration(const CancellationToken* token, uint64_t id);
        ~Registration();

        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;
        Registration(Registration&& other) noexcept;
        Registration& operator=(Registration&& other) noexcept;

    private:
        void reset();

        const CancellationToken* m_token = nullptr;
        uint64_t m_id = 0;
    };

    CancellationToken() = default;

    // Non-copyable
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();
    bool isCancelled() const { return m_cancelled.load(); }

    // Throws CancelledError once cancelled
    void throwIfCancelled() const;

    Registration subscribe(Callback callback) const;

private:
    void unsubscribe(uint64_t id) const;

    std::atomic<bool> m_cancelled{false};
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_idle;
    mutable std::map<uint64_t, Callback> m_callbacks;
    mutable uint64_t m_nextId = 1;
    // Callback currently invoked by cancel(), 0 when none
    uint64_t m_running = 0;
    std::thread::id m_dispatcher;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

}  // namespace sqlctx
