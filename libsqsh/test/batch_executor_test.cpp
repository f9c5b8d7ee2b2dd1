#include <atomic>
#include <cassert>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "../include/batch_executor.hpp"
#include "../include/codec_registry.hpp"
#include "../include/events.hpp"
#include "test_support.hpp"

using namespace sqsh;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting Batch Executor Test..." << std::endl;

    test::TempDir dir("sqsh_batch");
    const CodecRegistry registry;
    const TransformPipeline pipeline(registry);
    EventBus bus;

    std::atomic<int> started{0};
    std::atomic<int> completed{0};
    std::atomic<int> skipped{0};
    std::atomic<int> failed{0};
    std::mutex seen_mtx;
    std::set<fs::path> finished;

    bus.subscribe<TransformStartEvent>([&](const TransformStartEvent&) { ++started; });
    bus.subscribe<TransformCompleteEvent>([&](const TransformCompleteEvent& e) {
        ++completed;
        assert(e.new_size < e.original_size || e.output_path.extension() != e.path.extension());
        std::lock_guard lock(seen_mtx);
        finished.insert(e.path);
    });
    bus.subscribe<TransformSkippedEvent>([&](const TransformSkippedEvent& e) {
        ++skipped;
        std::lock_guard lock(seen_mtx);
        finished.insert(e.path);
    });
    bus.subscribe<TransformErrorEvent>([&](const TransformErrorEvent& e) {
        ++failed;
        assert(!e.error_message.empty());
        std::lock_guard lock(seen_mtx);
        finished.insert(e.path);
    });

    std::vector<TransformRequest> requests;
    for (int i = 0; i < 6; ++i) {
        const auto p = test::write_png(dir / ("bx_" + std::to_string(i) + ".png"),
                                       test::make_image(24 + i, 16, i % 2 == 0));
        requests.push_back({p, true, TargetFormat::Jpg});
    }
    requests.push_back({dir / "bx_missing.png", true, std::nullopt});
    test::write_bytes(dir / "bx_text.png", "not an image at all");
    requests.push_back({dir / "bx_text.png", true, std::nullopt});
    const auto optimal = test::write_png(dir / "bx_optimal.png", test::make_image(16, 16, false));
    requests.push_back({optimal, true, std::nullopt});

    BatchExecutor executor(pipeline, bus, 3);
    const auto results = executor.run(requests);

    // one result per request, in request order
    assert(results.size() == requests.size());
    for (size_t i = 0; i < results.size(); ++i) {
        assert(results[i].source_path == requests[i].source_path);
    }

    for (int i = 0; i < 6; ++i) {
        const auto& r = results[static_cast<size_t>(i)];
        assert(r.ok());
        assert(!r.error_kind);
        assert(!r.outcome->skipped);
        assert(r.outcome->output_path == dir / ("bx_" + std::to_string(i) + ".jpg"));
        assert(fs::exists(r.outcome->output_path));
    }

    assert(!results[6].ok());
    assert(results[6].error_kind == ErrorKind::NotFound);

    assert(!results[7].ok());
    assert(results[7].error_kind == ErrorKind::CodecFailure);
    assert(test::read_bytes(dir / "bx_text.png") == "not an image at all");

    assert(results[8].ok());
    assert(results[8].outcome->skipped);

    assert(started == 9);
    assert(completed == 6);
    assert(skipped == 1);
    assert(failed == 2);
    assert(finished.size() == 9);

    // a stopped executor runs nothing and reports every file
    BatchExecutor stopped(pipeline, bus, 2);
    stopped.request_stop();
    assert(stopped.is_stopped());
    const auto none = stopped.run({{optimal, true, std::nullopt}, {dir / "bx_missing.png", true, std::nullopt}});
    assert(none.size() == 2);
    for (const auto& r : none) {
        assert(!r.ok());
        assert(!r.error_kind);
        assert(!r.error_message.empty());
    }
    assert(started == 9);
    assert(skipped == 3);

    std::cout << "[PASS] Batch Executor Test." << std::endl;
    return 0;
}
