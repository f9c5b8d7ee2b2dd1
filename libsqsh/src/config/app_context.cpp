#include "../../include/app_context.hpp"
#include "../../include/errors.hpp"
#include "../../include/image_format.hpp"
#include "../../include/logger.hpp"

namespace sqsh {

AppContext::AppContext(std::unique_ptr<IConfigStore> store) : store_(std::move(store)) {}

void AppContext::load() {
    AppConfig loaded = store_->load();
    std::lock_guard lock(mtx_);
    config_ = std::move(loaded);
}

AppConfig AppContext::settings() const {
    std::lock_guard lock(mtx_);
    return config_;
}

AppConfig AppContext::update_settings(const SettingsPatch& patch) {
    std::optional<std::string> format;
    if (patch.convert_format) {
        const auto parsed = parse_target_format(*patch.convert_format);
        if (!parsed || *parsed == TargetFormat::Same) {
            throw SqshError(ErrorKind::UnsupportedFormat, "Unsupported convert format: " + *patch.convert_format);
        }
        format = target_format_to_string(*parsed);
    }

    std::lock_guard lock(mtx_);
    if (patch.dark_mode) config_.dark_mode = *patch.dark_mode;
    if (patch.overwrite) config_.overwrite = *patch.overwrite;
    if (patch.convert_enabled) config_.convert_enabled = *patch.convert_enabled;
    if (format) config_.convert_format = *format;

    persist_locked(Clock::now());
    return config_;
}

WindowState AppContext::window_state() const {
    std::lock_guard lock(mtx_);
    return config_.window;
}

void AppContext::set_window_state(const WindowState& state) {
    std::lock_guard lock(mtx_);
    config_.window = state;
}

bool AppContext::record_window_change(const std::function<void(WindowState&)>& mutate,
                                      const Clock::time_point now,
                                      const Clock::duration debounce) {
    std::lock_guard lock(mtx_);
    mutate(config_.window);

    if (last_persist_ && now - *last_persist_ < debounce) {
        return false;
    }
    return persist_locked(now);
}

bool AppContext::persist(const std::optional<Clock::time_point> now) {
    std::lock_guard lock(mtx_);
    return persist_locked(now.value_or(Clock::now()));
}

bool AppContext::persist_locked(const Clock::time_point now) {
    const bool ok = store_->save(config_);
    if (!ok) {
        Logger::log(LogLevel::Warning, "Settings were not saved", "app_context");
    }
    last_persist_ = now;
    return ok;
}

} // namespace sqsh
