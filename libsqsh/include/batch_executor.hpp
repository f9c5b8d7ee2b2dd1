/**
 * @file batch_executor.hpp
 * @brief Runs many independent transforms concurrently.
 */

#ifndef SQSH_BATCH_EXECUTOR_HPP
#define SQSH_BATCH_EXECUTOR_HPP

#include "errors.hpp"
#include "event_bus.hpp"
#include "thread_pool.hpp"
#include "transform.hpp"
#include "transform_pipeline.hpp"
#include <atomic>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sqsh {

/**
 * @brief Per-file result of a batch.
 *
 * Exactly one of outcome / error_kind is set for files that ran. Files
 * never started because the batch was stopped have neither, and
 * error_message says so.
 */
struct BatchResult {
    std::filesystem::path source_path;
    std::optional<TransformOutcome> outcome;
    std::optional<ErrorKind> error_kind;
    std::string error_message;

    [[nodiscard]] bool ok() const noexcept { return outcome.has_value(); }
};

/**
 * @brief Fans TransformRequests out over a ThreadPool.
 *
 * @details A failure in one file never affects the others. Progress is
 * published on the EventBus (TransformStart/Complete/Skipped/Error).
 * request_stop() keeps not-yet-started files from running; a transform
 * already in progress always finishes.
 */
class BatchExecutor {
public:
    static constexpr unsigned kDefaultThreads = 4;

    BatchExecutor(const TransformPipeline& pipeline, EventBus& bus, unsigned threads = kDefaultThreads);

    /**
     * @brief Runs all requests and blocks until they are done.
     * @return One result per request, in request order.
     */
    std::vector<BatchResult> run(const std::vector<TransformRequest>& requests);

    /// Thread-safe.
    void request_stop();

    [[nodiscard]] bool is_stopped() const {
        return stop_flag_.load(std::memory_order_relaxed);
    }

private:
    void run_one(const TransformRequest& request, BatchResult& result, const std::stop_token& st);

    const TransformPipeline& pipeline_;
    EventBus& event_bus_;
    ThreadPool pool_;
    std::atomic<bool> stop_flag_{false};
};

} // namespace sqsh

#endif // SQSH_BATCH_EXECUTOR_HPP
