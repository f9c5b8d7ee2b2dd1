#include "../../include/batch_executor.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include <stdexcept>

namespace sqsh {

    namespace {
        constexpr const char* kNotStarted = "Interrupted before start";
    }

    BatchExecutor::BatchExecutor(const TransformPipeline& pipeline, EventBus& bus, const unsigned threads)
        : pipeline_(pipeline),
          event_bus_(bus),
          pool_(threads) {}

    void BatchExecutor::run_one(const TransformRequest& request, BatchResult& result, const std::stop_token& st) {
        if (st.stop_requested() || is_stopped()) {
            return;
        }
        event_bus_.publish(TransformStartEvent{request.source_path});

        try {
            const TransformOutcome outcome = pipeline_.run(request);
            result.error_message.clear();
            result.outcome = outcome;
            if (outcome.skipped) {
                event_bus_.publish(TransformSkippedEvent{request.source_path, "No size improvement"});
            } else {
                event_bus_.publish(TransformCompleteEvent{
                    request.source_path, outcome.output_path,
                    outcome.original_size, outcome.new_size, outcome.duration
                });
            }
        } catch (const SqshError& e) {
            Logger::log(LogLevel::Error,
                        "error on " + request.source_path.string() + ": " + e.what(),
                        "batch_executor");
            result.error_kind = e.kind();
            result.error_message = e.what();
            event_bus_.publish(TransformErrorEvent{request.source_path, e.kind(), e.what()});
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error,
                        "unexpected error on " + request.source_path.string() + ": " + e.what(),
                        "batch_executor");
            result.error_kind = ErrorKind::IOFailure;
            result.error_message = e.what();
            event_bus_.publish(TransformErrorEvent{request.source_path, ErrorKind::IOFailure, e.what()});
        }
    }

    std::vector<BatchResult> BatchExecutor::run(const std::vector<TransformRequest>& requests) {
        std::vector<BatchResult> results(requests.size());
        for (size_t i = 0; i < requests.size(); ++i) {
            results[i].source_path = requests[i].source_path;
            results[i].error_message = kNotStarted;
        }

        Logger::log(LogLevel::Info,
                    "Running " + std::to_string(requests.size()) + " transforms on " +
                    std::to_string(pool_.size()) + " threads",
                    "batch_executor");

        // each task owns results[i], so no lock is needed around them
        for (size_t i = 0; i < requests.size(); ++i) {
            if (is_stopped()) break;
            try {
                pool_.enqueue([this, &requests, &results, i](const std::stop_token& st) {
                    run_one(requests[i], results[i], st);
                });
            } catch (const std::runtime_error& e) {
                Logger::log(LogLevel::Warning, std::string("Batch stopped while queuing: ") + e.what(), "batch_executor");
                break;
            }
        }
        pool_.wait_idle();

        for (const auto& r : results) {
            if (!r.outcome && !r.error_kind) {
                event_bus_.publish(TransformSkippedEvent{r.source_path, kNotStarted});
            }
        }
        return results;
    }

    void BatchExecutor::request_stop() {
        stop_flag_.store(true, std::memory_order_relaxed);
        pool_.request_stop();
        Logger::log(LogLevel::Info, "Batch stop requested", "batch_executor");
    }

} // namespace sqsh
