#include <cassert>
#include <chrono>
#include <climits>
#include <iostream>
#include <memory>
#include <vector>

#include "../include/window_geometry.hpp"

using namespace sqsh;
using namespace std::chrono_literals;

namespace {

class CountingStore final : public IConfigStore {
public:
    AppConfig initial;
    int saves = 0;
    AppConfig last_saved;

    AppConfig load() override { return initial; }

    bool save(const AppConfig& config) override {
        ++saves;
        last_saved = config;
        return true;
    }
};

class FakeHost final : public IWindowHost {
public:
    std::vector<Rect> screens;
    std::vector<WindowState> applied;

    std::vector<Rect> monitors() const override { return screens; }

    void apply_geometry(const WindowState& state) override { applied.push_back(state); }
};

bool inside(const WindowState& w, const Rect& m) {
    return w.x >= m.x && w.y >= m.y && w.x + w.width <= m.x + m.width && w.y + w.height <= m.y + m.height;
}

void test_clamp() {
    const std::vector<Rect> screens = {{0, 0, 1920, 1080}, {1920, 0, 1280, 1024}};

    // far off-screen falls back to the first monitor
    const WindowState lost = clamp_to_monitors({5000, -3000, 800, 600}, screens);
    assert(inside(lost, screens[0]));
    assert(lost.width == 800 && lost.height == 600);

    // overlapping the right edge of the second monitor is pulled back
    const WindowState edge = clamp_to_monitors({3000, 900, 800, 600}, screens);
    assert(inside(edge, screens[1]));
    assert(edge.x == 1920 + 1280 - 800 && edge.y == 1024 - 600);

    // too large for the monitor
    const WindowState huge = clamp_to_monitors({10, 10, 4000, 3000}, screens);
    assert(huge.width == 1920 && huge.height == 1080);
    assert(huge.x == 0 && huge.y == 0);

    // too small is raised to the minimum
    const WindowState tiny = clamp_to_monitors({100, 100, 50, 20}, screens);
    assert(tiny.width == kMinWindowWidth && tiny.height == kMinWindowHeight);
    assert(inside(tiny, screens[0]));

    // a window already visible is left alone
    const WindowState ok{200, 150, 1024, 700};
    assert(clamp_to_monitors(ok, screens) == ok);

    // coordinates at the ends of the int range still land on the first monitor
    const WindowState far = clamp_to_monitors({INT_MAX - 100, INT_MAX - 100, 800, 600}, screens);
    assert(inside(far, screens[0]));
    assert(far.x == 1920 - 800 && far.y == 1080 - 600);

    const WindowState below = clamp_to_monitors({INT_MIN, INT_MIN, 800, 600}, screens);
    assert(inside(below, screens[0]));
    assert(below.x == 0 && below.y == 0);

    const WindowState mixed = clamp_to_monitors({INT_MAX, INT_MIN, INT_MAX, INT_MAX}, screens);
    assert(inside(mixed, screens[0]));
    assert(mixed.width == 1920 && mixed.height == 1080);

    const Rect edge_rect{INT_MAX - 10, INT_MIN, 100, 100};
    assert(edge_rect.contains(INT_MAX - 5, INT_MIN + 5));
    assert(!edge_rect.contains(INT_MIN, INT_MIN));

    // no monitors: only the minimum size applies
    const WindowState none = clamp_to_monitors({-500, -500, 10, 10}, {});
    assert(none.x == -500 && none.y == -500);
    assert(none.width == kMinWindowWidth && none.height == kMinWindowHeight);
}

void test_lifecycle() {
    auto store = std::make_unique<CountingStore>();
    CountingStore* counter = store.get();
    counter->initial.window = {4000, 4000, 800, 600};

    AppContext context(std::move(store));
    context.load();

    FakeHost host;
    host.screens = {{0, 0, 1920, 1080}};

    AppContext::Clock::time_point now{};
    WindowGeometryManager manager(context, host, [&now] { return now; });

    // events before restore are ignored
    assert(manager.phase() == WindowPhase::Uninitialized);
    assert(!manager.on_moved(1, 1));
    assert(counter->saves == 0);
    assert(context.window_state().x == 4000);

    const WindowState restored = manager.restore();
    assert(manager.phase() == WindowPhase::Live);
    assert(host.applied.size() == 1 && host.applied[0] == restored);
    assert(inside(restored, host.screens[0]));
    assert(context.window_state() == restored);
    assert(counter->saves == 0);

    // first change persists, then one write per debounce interval
    now += 1s;
    assert(manager.on_moved(10, 20));
    assert(counter->saves == 1);

    for (int i = 0; i < 20; ++i) {
        now += 10ms;
        assert(!manager.on_moved(10 + i, 20 + i));
    }
    assert(counter->saves == 1);
    // the in-memory state still follows every event
    assert(context.window_state().x == 29 && context.window_state().y == 39);

    now += 500ms;
    assert(manager.on_resized(300, 200));
    assert(counter->saves == 2);
    assert(counter->last_saved.window.width == kMinWindowWidth);
    assert(counter->last_saved.window.height == kMinWindowHeight);

    now += 100ms;
    assert(!manager.on_resized(1000, 700));
    assert(counter->saves == 2);

    // close writes the latest geometry regardless of the debounce
    now += 1ms;
    manager.on_close();
    assert(counter->saves == 3);
    assert(counter->last_saved.window.width == 1000 && counter->last_saved.window.height == 700);
    assert(counter->last_saved.window.x == 29);
    assert(manager.phase() == WindowPhase::Uninitialized);

    assert(!manager.on_moved(0, 0));
    assert(counter->saves == 3);
}

void test_restore_without_monitors() {
    auto store = std::make_unique<CountingStore>();
    store->initial.window = {-200, -100, 100, 100};
    AppContext context(std::move(store));
    context.load();

    FakeHost host;
    WindowGeometryManager manager(context, host);
    const WindowState w = manager.restore();
    assert(w.x == -200 && w.y == -100);
    assert(w.width == kMinWindowWidth && w.height == kMinWindowHeight);
    assert(manager.phase() == WindowPhase::Live);
}

} // namespace

int main() {
    std::cout << "[Test] Starting Window Geometry Test..." << std::endl;

    test_clamp();
    test_lifecycle();
    test_restore_without_monitors();

    std::cout << "[PASS] Window Geometry Test." << std::endl;
    return 0;
}
