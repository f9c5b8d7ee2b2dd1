#include "../../include/window_geometry.hpp"
#include "../../include/logger.hpp"
#include <algorithm>

namespace sqsh {

WindowState clamp_to_monitors(WindowState state, const std::span<const Rect> monitors) {
    state.width = std::max(state.width, kMinWindowWidth);
    state.height = std::max(state.height, kMinWindowHeight);

    if (monitors.empty()) {
        return state;
    }

    const auto it = std::ranges::find_if(monitors, [&state](const Rect& m) {
        return m.contains(state.x, state.y);
    });
    const Rect& m = it != monitors.end() ? *it : monitors.front();

    state.width = std::min(state.width, m.width);
    state.height = std::min(state.height, m.height);

    // persisted coordinates may be anywhere in int range
    const long long right = static_cast<long long>(m.x) + m.width;
    const long long bottom = static_cast<long long>(m.y) + m.height;
    if (static_cast<long long>(state.x) + state.width > right) state.x = static_cast<int>(right - state.width);
    if (static_cast<long long>(state.y) + state.height > bottom) state.y = static_cast<int>(bottom - state.height);
    if (state.x < m.x) state.x = m.x;
    if (state.y < m.y) state.y = m.y;

    return state;
}

WindowGeometryManager::WindowGeometryManager(AppContext& context, IWindowHost& host, ClockFn clock)
    : context_(context), host_(host), clock_(std::move(clock)) {}

WindowState WindowGeometryManager::restore() {
    phase_ = WindowPhase::Restoring;

    const WindowState persisted = context_.window_state();
    const auto monitors = host_.monitors();
    const WindowState clamped = clamp_to_monitors(persisted, monitors);

    if (monitors.empty()) {
        Logger::log(LogLevel::Warning, "No monitors reported, only the minimum size is enforced", "window_geometry");
    }
    if (clamped != persisted) {
        Logger::log(LogLevel::Info,
                    "Window geometry adjusted to " + std::to_string(clamped.width) + "x" +
                    std::to_string(clamped.height) + "+" + std::to_string(clamped.x) + "+" +
                    std::to_string(clamped.y),
                    "window_geometry");
    }

    host_.apply_geometry(clamped);
    context_.set_window_state(clamped);

    phase_ = WindowPhase::Live;
    return clamped;
}

bool WindowGeometryManager::record(const std::function<void(WindowState&)>& mutate) {
    if (phase_ != WindowPhase::Live) {
        return false;
    }
    return context_.record_window_change(mutate, clock_(), kDebounceInterval);
}

bool WindowGeometryManager::on_moved(const int x, const int y) {
    return record([x, y](WindowState& w) {
        w.x = x;
        w.y = y;
    });
}

bool WindowGeometryManager::on_resized(const int width, const int height) {
    return record([width, height](WindowState& w) {
        w.width = std::max(width, kMinWindowWidth);
        w.height = std::max(height, kMinWindowHeight);
    });
}

void WindowGeometryManager::on_close() {
    if (!context_.persist(clock_())) {
        Logger::log(LogLevel::Warning, "Window geometry could not be saved on close", "window_geometry");
    }
    phase_ = WindowPhase::Uninitialized;
}

} // namespace sqsh
