#pragma once

#include "ExecutionContext.hpp"
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

namespace sqlctx {

/**
 * @class TaskHandle
 * @brief Result of spawn(): the child task's future plus its context.
 *
 * Destroying the handle waits for the task to finish.
 */
template <typename T>
class TaskHandle {
public:
    TaskHandle(std::future<T> future, std::shared_ptr<ExecutionContext> context)
        : m_future(std::move(future)), m_context(std::move(context)) {}

    // Waits for the task and returns its result, rethrowing its exception
    T get() { return m_future.get(); }

    void wait() const { m_future.wait(); }

    template <typename Rep, typename Period>
    std::future_status waitFor(const std::chrono::duration<Rep, Period>& timeout) const {
        return m_future.wait_for(timeout);
    }

    // Wakes the task up if it waits for a pooled connection
    void cancel() { m_context->cancellationToken()->cancel(); }

    const std::shared_ptr<ExecutionContext>& context() const { return m_context; }

private:
    std::future<T> m_future;
    std::shared_ptr<ExecutionContext> m_context;
};

/**
 * @brief Run `fn` on a new thread bound to a fork of the current context.
 */
template <typename Fn>
auto spawn(Fn&& fn) -> TaskHandle<std::invoke_result_t<std::decay_t<Fn>>> {
    using Result = std::invoke_result_t<std::decay_t<Fn>>;

    auto child = ExecutionContext::current()->fork();
    std::future<Result> future = std::async(
        std::launch::async,
        [child, task = std::forward<Fn>(fn)]() mutable -> Result {
            ContextScope scope(child);
            return task();
        });
    return TaskHandle<Result>(std::move(future), child);
}

}  // namespace sqlctx
