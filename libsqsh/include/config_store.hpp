/**
 * @file config_store.hpp
 * @brief Loading and saving of AppConfig.
 */

#ifndef SQSH_CONFIG_STORE_HPP
#define SQSH_CONFIG_STORE_HPP

#include "app_config.hpp"
#include <filesystem>

namespace sqsh {

/**
 * @brief Durable storage for AppConfig.
 *
 * Implementations never throw: load() falls back to defaults and save()
 * reports failure through its return value, logging the cause.
 */
class IConfigStore {
public:
    virtual ~IConfigStore() = default;

    [[nodiscard]] virtual AppConfig load() = 0;

    virtual bool save(const AppConfig& config) = 0;
};

/**
 * @brief settings.json backed store (nlohmann::json).
 *
 * Each field is read independently: a missing or mistyped field takes its
 * default without discarding the others. Unknown keys already in the file
 * are preserved on save.
 */
class JsonConfigStore final : public IConfigStore {
public:
    /// Uses default_path().
    JsonConfigStore();

    explicit JsonConfigStore(std::filesystem::path path);

    [[nodiscard]] AppConfig load() override;

    bool save(const AppConfig& config) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /**
     * @brief Per-user settings location.
     *
     * Linux: $XDG_CONFIG_HOME/sqsh/settings.json, else ~/.config/sqsh/settings.json.
     * macOS: ~/Library/Application Support/sqsh/settings.json.
     * Windows: %APPDATA%\sqsh\settings.json.
     * Falls back to the temp directory when no home can be found.
     */
    static std::filesystem::path default_path();

private:
    std::filesystem::path path_;
};

} // namespace sqsh

#endif // SQSH_CONFIG_STORE_HPP
