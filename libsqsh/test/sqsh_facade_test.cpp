#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <thread>

#include "../include/sqsh.hpp"
#include "test_support.hpp"

using namespace sqsh;

int main() {
    std::cout << "[Test] Starting Sqsh Facade Test..." << std::endl;

    test::TempDir dir("sqsh_facade");
    Sqsh sqsh(std::make_unique<JsonConfigStore>(dir / "settings.json"));
    sqsh.threads(2);

    const auto png = test::write_png(dir / "fc_small.png", test::make_image(8, 8, false));
    const std::vector<std::filesystem::path> files = {png, dir / "fc_missing.png"};

    // stop() called from another thread while batches start and finish
    std::atomic<bool> done{false};
    std::atomic<int> stops{0};
    std::jthread stopper([&] {
        while (!done.load()) {
            sqsh.stop();
            ++stops;
        }
    });

    for (int round = 0; round < 200; ++round) {
        const auto results = sqsh.optimize_batch(files, true);
        assert(results.size() == 2);
        // each file ran to a result or was never started
        assert(!results[0].error_kind);
        assert(!results[1].ok());
        assert(!results[1].error_kind || *results[1].error_kind == ErrorKind::NotFound);
    }
    done.store(true);
    stopper.join();
    assert(stops.load() > 0);

    // with nothing running, stop() is a no-op and later batches run normally
    sqsh.stop();
    const auto after = sqsh.optimize_batch(files, true);
    assert(after[0].ok() && after[0].outcome->skipped);
    assert(after[1].error_kind == ErrorKind::NotFound);

    bool threw = false;
    try {
        (void)sqsh.optimize_batch(files, true, std::string("tiff"));
    } catch (const SqshError& e) {
        threw = true;
        assert(e.kind() == ErrorKind::UnsupportedFormat);
    }
    assert(threw);

    std::cout << "[PASS] Sqsh Facade Test." << std::endl;
    return 0;
}
