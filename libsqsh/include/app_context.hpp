/**
 * @file app_context.hpp
 * @brief Lock-guarded owner of the live AppConfig.
 */

#ifndef SQSH_APP_CONTEXT_HPP
#define SQSH_APP_CONTEXT_HPP

#include "app_config.hpp"
#include "config_store.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace sqsh {

/**
 * @brief Holds AppConfig (settings and window geometry) and the time of the
 * last persisted write. Every access goes through one mutex, and writes to
 * the store happen while it is held.
 */
class AppContext {
public:
    using Clock = std::chrono::steady_clock;

    explicit AppContext(std::unique_ptr<IConfigStore> store);

    /// Replaces the in-memory config with the store's contents.
    void load();

    [[nodiscard]] AppConfig settings() const;

    /**
     * @brief Applies a patch and persists immediately.
     * @throws SqshError (UnsupportedFormat) if convert_format is not jpg,
     * jpeg, png or webp. Nothing is changed in that case.
     * @return The updated config.
     */
    AppConfig update_settings(const SettingsPatch& patch);

    [[nodiscard]] WindowState window_state() const;

    /// Updates the window geometry in memory only.
    void set_window_state(const WindowState& state);

    /**
     * @brief Mutates the window geometry and persists if no write happened
     * yet or at least debounce has passed since the last one.
     * @return true if the change was written.
     */
    bool record_window_change(const std::function<void(WindowState&)>& mutate,
                              Clock::time_point now,
                              Clock::duration debounce);

    /**
     * @brief Writes the current config unconditionally.
     * @param now Timestamp recorded as the last write; Clock::now() if empty.
     */
    bool persist(std::optional<Clock::time_point> now = std::nullopt);

private:
    bool persist_locked(Clock::time_point now);

    std::unique_ptr<IConfigStore> store_;
    mutable std::mutex mtx_;
    AppConfig config_;
    std::optional<Clock::time_point> last_persist_; ///< Empty until the first write
};

} // namespace sqsh

#endif // SQSH_APP_CONTEXT_HPP
