/**
 * @file thread_pool.hpp
 * @brief Defines a simple, thread-safe, fixed-size thread pool.
 *
 * TransferScheduler runs every TransferUnit on this pool.
 */

#ifndef AUDIOMIRROR_THREAD_POOL_HPP
#define AUDIOMIRROR_THREAD_POOL_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

namespace audiomirror {

/**
 * @brief A fixed-size thread pool for executing tasks concurrently.
 *
 * @details Workers are std::jthread instances, so they join on destruction
 * and support cooperative cancellation via std::stop_token. Enqueued tasks
 * receive the worker's stop token as their only argument.
 */
class ThreadPool {
public:
    /**
     * @brief Constructs the thread pool and starts worker threads.
     * @param threads Number of worker threads. Zero is treated as one.
     */
    explicit ThreadPool(unsigned threads = std::thread::hardware_concurrency());

    /**
     * @brief Destructor. Requests stop and joins all worker threads.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a task to be executed by a worker thread.
     *
     * @tparam F Callable accepting a `std::stop_token`.
     * @param f The task to execute.
     * @return A std::future for the task's result.
     * @throws std::runtime_error if the pool has been stopped.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f)
        );
        {
            std::unique_lock lock(queue_mutex_);
            if (stop_) throw std::runtime_error("enqueue on stopped ThreadPool");
            ++pending_;
            tasks_.emplace([task](std::stop_token st) { (*task)(st); });
        }
        condition_.notify_one();
        return task->get_future();
    }

    /**
     * @brief Blocks the calling thread until all pending tasks are complete.
     */
    void wait_idle();

    /**
     * @brief Waits at most @p timeout for the pool to become idle.
     * @return true if no task is queued or running anymore.
     */
    bool wait_idle_for(std::chrono::milliseconds timeout);

    /**
     * @brief Requests all worker threads to stop and clears the task queue.
     *
     * Tasks that have not started are discarded. Running tasks are
     * notified through their stop_token.
     *
     * @return Number of discarded tasks.
     */
    std::size_t request_stop();

    /// @return Number of worker threads.
    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

private:
    std::mutex queue_mutex_;                ///< Protects tasks_, stop_, and pending_
    std::condition_variable_any condition_; ///< Notifies workers of new tasks or stop requests
    std::condition_variable idle_cv_;       ///< Notifies waiters when pending_ drops to zero
    std::queue<std::function<void(std::stop_token)>> tasks_; ///< The queue of tasks
    bool stop_{false};                      ///< Flag to signal workers to stop
    std::size_t pending_{0};                ///< Number of tasks enqueued or running
    std::vector<std::jthread> workers_;     ///< The worker threads
};

} // namespace audiomirror

#endif // AUDIOMIRROR_THREAD_POOL_HPP
