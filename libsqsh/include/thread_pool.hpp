/**
 * @file thread_pool.hpp
 * @brief Fixed-size thread pool used by BatchExecutor.
 */

#ifndef SQSH_THREAD_POOL_HPP
#define SQSH_THREAD_POOL_HPP

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

namespace sqsh {

/**
 * @brief Runs queued tasks on std::jthread workers.
 *
 * @details Tasks take a `std::stop_token`. request_stop() drops queued
 * tasks and signals the running ones; workers are joined on destruction.
 */
class ThreadPool {
public:
    /**
     * @param threads Number of workers; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned threads);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queues a task.
     * @return Future of the task's result. Tasks dropped by request_stop()
     * leave their future with a broken_promise error.
     * @throws std::runtime_error if the pool was stopped.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f)
        );
        auto result = task->get_future();
        {
            std::unique_lock lock(queue_mutex_);
            if (stop_) throw std::runtime_error("enqueue on stopped ThreadPool");
            ++pending_;
            tasks_.emplace([task](std::stop_token st) { (*task)(st); });
        }
        condition_.notify_one();
        return result;
    }

    /// Blocks until every queued and running task has finished.
    void wait_idle();

    /// Discards queued tasks and asks running ones to stop.
    void request_stop();

    [[nodiscard]] unsigned size() const noexcept { return static_cast<unsigned>(workers_.size()); }

private:
    bool next_task(const std::stop_token& st, std::function<void(std::stop_token)>& task);
    void worker_loop(const std::stop_token& st);

    std::mutex queue_mutex_;                ///< Protects tasks_, stop_, and pending_
    std::condition_variable_any condition_; ///< Wakes workers on new tasks or stop
    std::condition_variable idle_cv_;       ///< Wakes wait_idle() when pending_ reaches zero
    std::queue<std::function<void(std::stop_token)>> tasks_;
    bool stop_{false};
    size_t pending_{0};                     ///< Tasks queued or running
    std::vector<std::jthread> workers_;
};

} // namespace sqsh

#endif // SQSH_THREAD_POOL_HPP
