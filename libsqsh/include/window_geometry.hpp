/**
 * @file window_geometry.hpp
 * @brief Restores the main window onto a visible monitor and persists its
 * geometry as it moves.
 */

#ifndef SQSH_WINDOW_GEOMETRY_HPP
#define SQSH_WINDOW_GEOMETRY_HPP

#include "app_config.hpp"
#include "app_context.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <span>
#include <vector>

namespace sqsh {

/**
 * @brief Monitor work area in virtual screen coordinates.
 */
struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    [[nodiscard]] bool contains(const int px, const int py) const noexcept {
        return px >= x && py >= y &&
               static_cast<long long>(px) < static_cast<long long>(x) + width &&
               static_cast<long long>(py) < static_cast<long long>(y) + height;
    }

    bool operator==(const Rect&) const = default;
};

/**
 * @brief What the geometry manager needs from a windowing toolkit.
 */
class IWindowHost {
public:
    virtual ~IWindowHost() = default;

    /// Work areas of the attached monitors, primary first when known.
    [[nodiscard]] virtual std::vector<Rect> monitors() const = 0;

    virtual void apply_geometry(const WindowState& state) = 0;
};

/**
 * @brief Fits a rectangle onto the monitors.
 *
 * Width and height are raised to the minimum size, then, on the monitor
 * holding the top-left corner (or the first monitor), lowered to the
 * monitor size. The rectangle is then shifted so its right/bottom edges
 * and afterwards its left/top edges lie inside the monitor. With no
 * monitors only the minimum size applies.
 */
WindowState clamp_to_monitors(WindowState state, std::span<const Rect> monitors);

enum class WindowPhase {
    Uninitialized,
    Restoring,
    Live
};

/**
 * @brief Startup restore, debounced persistence of move/resize events and
 * the final write on close.
 *
 * Events arriving outside the Live phase are ignored.
 */
class WindowGeometryManager {
public:
    using Clock = AppContext::Clock;
    using ClockFn = std::function<Clock::time_point()>;

    static constexpr std::chrono::milliseconds kDebounceInterval{500};

    WindowGeometryManager(AppContext& context, IWindowHost& host, ClockFn clock = &Clock::now);

    /**
     * @brief Clamps the persisted geometry, applies it to the host and goes Live.
     * @return The applied geometry.
     */
    WindowState restore();

    /// @return true if the new position was persisted.
    bool on_moved(int x, int y);

    /// @return true if the new size was persisted.
    bool on_resized(int width, int height);

    /// Persists unconditionally and returns to Uninitialized.
    void on_close();

    [[nodiscard]] WindowPhase phase() const noexcept { return phase_.load(); }

private:
    bool record(const std::function<void(WindowState&)>& mutate);

    AppContext& context_;
    IWindowHost& host_;
    ClockFn clock_;
    std::atomic<WindowPhase> phase_{WindowPhase::Uninitialized};
};

} // namespace sqsh

#endif // SQSH_WINDOW_GEOMETRY_HPP
