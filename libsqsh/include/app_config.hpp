/**
 * @file app_config.hpp
 * @brief Persisted application settings and window geometry.
 */

#ifndef SQSH_APP_CONFIG_HPP
#define SQSH_APP_CONFIG_HPP

#include <optional>
#include <string>

namespace sqsh {

inline constexpr int kMinWindowWidth = 480;
inline constexpr int kMinWindowHeight = 360;

/**
 * @brief Outer window rectangle in virtual screen coordinates.
 */
struct WindowState {
    int x = 100;
    int y = 100;
    int width = 800;
    int height = 600;

    bool operator==(const WindowState&) const = default;
};

/**
 * @brief Everything stored in settings.json.
 */
struct AppConfig {
    WindowState window;
    bool dark_mode = true;
    bool overwrite = true;
    bool convert_enabled = false;
    std::string convert_format = "jpg"; ///< jpg, png or webp

    bool operator==(const AppConfig&) const = default;
};

/**
 * @brief Partial settings update; empty fields are left unchanged.
 */
struct SettingsPatch {
    std::optional<bool> dark_mode;
    std::optional<bool> overwrite;
    std::optional<bool> convert_enabled;
    std::optional<std::string> convert_format;
};

} // namespace sqsh

#endif // SQSH_APP_CONFIG_HPP
