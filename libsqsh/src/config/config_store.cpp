#include "../../include/config_store.hpp"
#include "../../include/image_format.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace sqsh {

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return value && *value ? value : nullptr;
}

template <typename T>
void read_field(const json& j, const char* key, T& out) {
    const auto it = j.find(key);
    if (it == j.end()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        Logger::log(LogLevel::Warning,
                    std::string("Ignoring invalid settings field '") + key + "': " + e.what(),
                    "config_store");
    }
}

// accepts only conversion targets; "same" is not a setting
std::optional<std::string> canonical_convert_format(const std::string& value) {
    const auto parsed = parse_target_format(value);
    if (!parsed || *parsed == TargetFormat::Same) return std::nullopt;
    return target_format_to_string(*parsed);
}

json to_json(const AppConfig& c) {
    return {
        {"window", {
            {"x", c.window.x},
            {"y", c.window.y},
            {"width", c.window.width},
            {"height", c.window.height},
        }},
        {"dark_mode", c.dark_mode},
        {"overwrite", c.overwrite},
        {"convert_enabled", c.convert_enabled},
        {"convert_format", c.convert_format},
    };
}

} // namespace

JsonConfigStore::JsonConfigStore() : path_(default_path()) {}

JsonConfigStore::JsonConfigStore(fs::path path) : path_(std::move(path)) {}

fs::path JsonConfigStore::default_path() {
#if defined(_WIN32)
    if (const char* appdata = env("APPDATA")) {
        return fs::path(appdata) / "sqsh" / "settings.json";
    }
#elif defined(__APPLE__)
    if (const char* home = env("HOME")) {
        return fs::path(home) / "Library" / "Application Support" / "sqsh" / "settings.json";
    }
#else
    if (const char* xdg = env("XDG_CONFIG_HOME")) {
        return fs::path(xdg) / "sqsh" / "settings.json";
    }
    if (const char* home = env("HOME")) {
        return fs::path(home) / ".config" / "sqsh" / "settings.json";
    }
#endif
    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    return (ec ? fs::path(".") : tmp) / "sqsh" / "settings.json";
}

AppConfig JsonConfigStore::load() {
    AppConfig config;

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        Logger::log(LogLevel::Info, "No settings at " + path_.string() + ", using defaults", "config_store");
        return config;
    }

    json j;
    try {
        std::ifstream f(path_);
        if (!f) {
            Logger::log(LogLevel::Warning, "Cannot open settings: " + path_.string(), "config_store");
            return config;
        }
        f >> j;
    } catch (const json::exception& e) {
        Logger::log(LogLevel::Warning,
                    "Error reading " + path_.string() + ": " + e.what() + ", using defaults",
                    "config_store");
        return config;
    }
    if (!j.is_object()) {
        Logger::log(LogLevel::Warning, "Settings root is not an object, using defaults", "config_store");
        return config;
    }

    if (const auto w = j.find("window"); w != j.end() && w->is_object()) {
        read_field(*w, "x", config.window.x);
        read_field(*w, "y", config.window.y);
        read_field(*w, "width", config.window.width);
        read_field(*w, "height", config.window.height);
        config.window.width = std::max(config.window.width, kMinWindowWidth);
        config.window.height = std::max(config.window.height, kMinWindowHeight);
    }
    read_field(j, "dark_mode", config.dark_mode);
    read_field(j, "overwrite", config.overwrite);
    read_field(j, "convert_enabled", config.convert_enabled);

    std::string format = config.convert_format;
    read_field(j, "convert_format", format);
    if (const auto canonical = canonical_convert_format(format)) {
        config.convert_format = *canonical;
    } else {
        Logger::log(LogLevel::Warning, "Unknown convert_format '" + format + "', using jpg", "config_store");
    }

    Logger::log(LogLevel::Debug, "Loaded settings from " + path_.string(), "config_store");
    return config;
}

bool JsonConfigStore::save(const AppConfig& config) {
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec) {
        Logger::log(LogLevel::Warning,
                    "Cannot create settings directory " + path_.parent_path().string() + " (" + ec.message() + ")",
                    "config_store");
        return false;
    }

    // keep keys written by other versions
    json j = json::object();
    if (fs::exists(path_, ec)) {
        try {
            std::ifstream in(path_);
            json existing;
            in >> existing;
            if (existing.is_object()) j = std::move(existing);
        } catch (const json::exception& e) {
            Logger::log(LogLevel::Debug, std::string("Replacing unreadable settings: ") + e.what(), "config_store");
        }
    }
    j.update(to_json(config));

    const fs::path tmp = path_.parent_path() / (path_.filename().string() + "." + RandomUtils::unique_token() + ".tmp");
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            Logger::log(LogLevel::Warning, "Cannot write settings: " + tmp.string(), "config_store");
            return false;
        }
        out << j.dump(4);
        out.flush();
        if (!out) {
            Logger::log(LogLevel::Warning, "Short write on settings: " + tmp.string(), "config_store");
            out.close();
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        Logger::log(LogLevel::Warning,
                    "Cannot replace settings " + path_.string() + " (" + ec.message() + ")",
                    "config_store");
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return false;
    }
    Logger::log(LogLevel::Debug, "Saved settings to " + path_.string(), "config_store");
    return true;
}

} // namespace sqsh
