/**
 * @file worker_pool.hpp
 * @brief Fixed-size std::jthread worker pool.
 *
 * Bounds concurrency for block transfers (one slot per concurrent block)
 * and for failover handling. shutdown() drains every queued task before it
 * returns.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace model_mesh {

class WorkerPool {
public:
    /// @p num_threads must be at least 1; 0 is treated as 1.
    explicit WorkerPool(size_t num_threads);
    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Submit a callable for execution. Exceptions surface through the future.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Stop accepting work, finish what is queued and join the workers.
    void shutdown();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
    bool accepting_ = true;
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> WorkerPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    auto task = [p = promise, f = std::forward<F>(func)]() mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f();
                p->set_value();
            } else {
                p->set_value(f());
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    };

    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_) {
            promise->set_exception(std::make_exception_ptr(
                std::runtime_error("WorkerPool is shut down")));
            return future;
        }
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
    return future;
}

}  // namespace model_mesh
