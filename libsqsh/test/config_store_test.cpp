#include <cassert>
#include <fstream>
#include <iostream>
#include <memory>

#include <nlohmann/json.hpp>

#include "../include/app_context.hpp"
#include "../include/config_store.hpp"
#include "../include/errors.hpp"
#include "test_support.hpp"

using namespace sqsh;
using json = nlohmann::json;

static json read_json(const std::filesystem::path& p) {
    std::ifstream in(p);
    return json::parse(in);
}

static void test_defaults(const test::TempDir& dir) {
    JsonConfigStore store(dir / "absent" / "settings.json");
    assert(store.load() == AppConfig{});

    test::write_bytes(dir / "broken.json", "{ not json");
    assert(JsonConfigStore(dir / "broken.json").load() == AppConfig{});

    test::write_bytes(dir / "array.json", "[1, 2, 3]");
    assert(JsonConfigStore(dir / "array.json").load() == AppConfig{});
}

static void test_partial_fields(const test::TempDir& dir) {
    test::write_bytes(dir / "partial.json", R"({
        "window": {"x": 12, "y": "oops", "width": 100, "height": 900},
        "dark_mode": false,
        "overwrite": "yes",
        "convert_enabled": true,
        "convert_format": "JPEG"
    })");
    const AppConfig c = JsonConfigStore(dir / "partial.json").load();
    assert(c.window.x == 12);
    assert(c.window.y == WindowState{}.y);
    assert(c.window.width == kMinWindowWidth);
    assert(c.window.height == 900);
    assert(!c.dark_mode);
    assert(c.overwrite);
    assert(c.convert_enabled);
    assert(c.convert_format == "jpg");

    test::write_bytes(dir / "badformat.json", R"({"convert_format": "tiff"})");
    assert(JsonConfigStore(dir / "badformat.json").load().convert_format == "jpg");
}

static void test_save_roundtrip(const test::TempDir& dir) {
    const auto path = dir / "nested" / "deeper" / "settings.json";
    test::write_bytes(path, R"({"language": "it", "dark_mode": true})");

    AppConfig c;
    c.window = {-50, 30, 1024, 768};
    c.dark_mode = false;
    c.overwrite = false;
    c.convert_enabled = true;
    c.convert_format = "webp";

    JsonConfigStore store(path);
    assert(store.save(c));
    assert(store.load() == c);

    const json j = read_json(path);
    assert(j.at("language") == "it");
    assert(j.at("dark_mode") == false);
    assert(j.at("window").at("x") == -50);
    assert(j.at("convert_format") == "webp");

    // no temporary files left next to the settings
    size_t files = 0;
    for ([[maybe_unused]] const auto& e : std::filesystem::directory_iterator(path.parent_path())) ++files;
    assert(files == 1);
}

static void test_context_updates(const test::TempDir& dir) {
    const auto path = dir / "ctx" / "settings.json";
    AppContext context(std::make_unique<JsonConfigStore>(path));
    context.load();
    assert(context.settings() == AppConfig{});

    SettingsPatch patch;
    patch.dark_mode = false;
    patch.convert_format = "WEBP";
    const AppConfig updated = context.update_settings(patch);
    assert(!updated.dark_mode);
    assert(updated.overwrite);
    assert(updated.convert_format == "webp");
    assert(JsonConfigStore(path).load() == updated);

    // rejected patches change nothing
    for (const char* bad : {"bmp", "same", ""}) {
        SettingsPatch invalid;
        invalid.overwrite = false;
        invalid.convert_format = bad;
        bool threw = false;
        try {
            context.update_settings(invalid);
        } catch (const SqshError& e) {
            threw = true;
            assert(e.kind() == ErrorKind::UnsupportedFormat);
        }
        assert(threw);
        assert(context.settings() == updated);
    }

    // window changes stay in memory until persisted
    context.set_window_state({1, 2, 640, 480});
    assert(JsonConfigStore(path).load().window == WindowState{});
    assert(context.persist());
    assert(JsonConfigStore(path).load().window == (WindowState{1, 2, 640, 480}));
}

int main() {
    std::cout << "[Test] Starting Config Store Test..." << std::endl;

    test::TempDir dir("sqsh_config");
    test_defaults(dir);
    test_partial_fields(dir);
    test_save_roundtrip(dir);
    test_context_updates(dir);

    assert(JsonConfigStore::default_path().filename() == "settings.json");

    std::cout << "[PASS] Config Store Test." << std::endl;
    return 0;
}
