#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"

namespace sqsh {

namespace {

// marks a dequeued task finished however it exits
class PendingTask {
public:
    PendingTask(std::mutex& mtx, size_t& pending, std::condition_variable& idle)
        : mtx_(mtx), pending_(pending), idle_(idle) {}

    ~PendingTask() {
        {
            std::lock_guard lock(mtx_);
            if (pending_ > 0) --pending_;
        }
        idle_.notify_all();
    }

    PendingTask(const PendingTask&) = delete;
    PendingTask& operator=(const PendingTask&) = delete;

private:
    std::mutex& mtx_;
    size_t& pending_;
    std::condition_variable& idle_;
};

} // namespace

ThreadPool::ThreadPool(const unsigned threads) {
    const unsigned count = threads ? threads : 1;
    workers_.reserve(count);
    for (unsigned i = 0; i < count; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) { worker_loop(st); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();
    // jthread members request stop and join
}

bool ThreadPool::next_task(const std::stop_token& st, std::function<void(std::stop_token)>& task) {
    std::unique_lock lock(queue_mutex_);
    condition_.wait(lock, st, [this] { return stop_ || !tasks_.empty(); });
    if (st.stop_requested() || tasks_.empty()) {
        return false;
    }
    task = std::move(tasks_.front());
    tasks_.pop();
    return true;
}

void ThreadPool::worker_loop(const std::stop_token& st) {
    std::function<void(std::stop_token)> task;
    while (next_task(st, task)) {
        const PendingTask done(queue_mutex_, pending_, idle_cv_);
        try {
            task(st);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string("Task threw: ") + e.what(), "thread_pool");
        }
        task = nullptr;
    }
}

void ThreadPool::request_stop() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
        pending_ -= std::min(pending_, tasks_.size());
        tasks_ = {};
    }
    condition_.notify_all();
    idle_cv_.notify_all();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return pending_ == 0; });
}

} // namespace sqsh
