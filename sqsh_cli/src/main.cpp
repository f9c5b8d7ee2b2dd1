#include <chrono>
#include <clocale>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "utils/color.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libsqsh/include/sqsh.hpp"
#include "../../libsqsh/include/file_utils.hpp"
#include "../../libsqsh/include/logger.hpp"

using namespace sqsh;
namespace fs = std::filesystem;

static volatile std::sig_atomic_t interrupted = 0;

// handle ctrl+c or termination signals; the stop itself runs on a watcher thread
extern "C" void signal_handler(const int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted = 1;
    }
}

// forwards an interrupt to the running batch
static std::jthread start_interrupt_watcher(Sqsh& sqsh) {
    return std::jthread([&sqsh](const std::stop_token& st) {
        while (!st.stop_requested()) {
            if (interrupted) {
                Logger::log(LogLevel::Warning, "Interrupted, finishing files in progress", "main");
                sqsh.stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return;
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8", ".UTF-8" /* Windows */};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

// prints progress lines as files finish
class ConsoleObserver final : public SqshObserver {
public:
    explicit ConsoleObserver(const bool quiet) : quiet_(quiet) {}

    void on_file_finish(const fs::path& path, const fs::path& output,
                        const std::uintmax_t size_before, const std::uintmax_t size_after) override {
        if (quiet_) return;
        std::cerr << GREEN << "[DONE] " << path.filename().string()
                  << " (" << size_before << " -> " << size_after << " bytes)";
        if (output != path) std::cerr << " -> " << output.string();
        std::cerr << RESET << std::endl;
    }

    void on_file_skipped(const fs::path& path, const std::string& reason) override {
        if (quiet_) return;
        std::cerr << YELLOW << "[SKIP] " << path.filename().string() << " (" << reason << ")" << RESET << std::endl;
    }

    void on_file_error(const fs::path& path, const ErrorKind kind, const std::string& error) override {
        std::cerr << RED << "[FAIL] " << path.filename().string()
                  << " [" << error_kind_name(kind) << "] " << error << RESET << std::endl;
    }

private:
    bool quiet_;
};

// mirrors the desktop flow for results kept in the temp directory
static int save_results(Sqsh& sqsh, const std::vector<BatchResult>& results, const fs::path& save_path) {
    std::vector<ArchiveEntry> entries;
    std::vector<fs::path> staged;
    for (const auto& r : results) {
        if (!r.outcome) continue;
        const auto& out = r.outcome->output_path;
        entries.push_back({out, r.source_path.stem().string() + out.extension().string()});
        if (!r.outcome->skipped) staged.push_back(out);
    }
    if (entries.empty()) {
        std::cerr << RED << "Nothing to save." << RESET << std::endl;
        return 1;
    }

    int rc = 0;
    try {
        if (entries.size() == 1) {
            sqsh.copy_file(entries.front().source_path, save_path);
        } else {
            sqsh.package_archive(entries, save_path);
        }
        std::cerr << CYAN << "Saved to " << save_path.string() << RESET << std::endl;
    } catch (const SqshError& e) {
        std::cerr << RED << "Save failed [" << error_kind_name(e.kind()) << "]: " << e.what() << RESET << std::endl;
        rc = 1;
    }

    for (const auto& p : staged) {
        remove_file_logged(p, "main");
    }
    return rc;
}

static int run_optimize(Sqsh& sqsh, const Settings& settings) {
    const AppConfig config = sqsh.get_settings();
    const bool overwrite = settings.overwrite.value_or(config.overwrite);

    std::optional<std::string> target = settings.target_format;
    if (!target && config.convert_enabled) {
        target = config.convert_format;
    }

    const auto files = sqsh.scan_inputs(settings.inputs);
    if (files.empty()) {
        Logger::log(LogLevel::Error, "No valid input files.", "main");
        return 1;
    }

    sqsh.threads(settings.num_threads);
    const auto results = sqsh.optimize_batch(files, overwrite, target);

    std::uintmax_t saved = 0;
    size_t failed = 0;
    for (const auto& r : results) {
        if (r.outcome) saved += r.outcome->saved_bytes;
        else if (r.error_kind) ++failed;
    }
    if (!settings.quiet) {
        std::cerr << CYAN << results.size() << " files, " << failed << " failed, "
                  << saved << " bytes saved" << RESET << std::endl;
    }

    int rc = failed ? 1 : 0;
    if (!overwrite) {
        if (!settings.save_path.empty()) {
            if (save_results(sqsh, results, settings.save_path) != 0) rc = 1;
        } else {
            for (const auto& r : results) {
                if (r.outcome) std::cout << r.outcome->output_path.string() << "\n";
            }
        }
    }
    return rc;
}

static int run_pack(Sqsh& sqsh, const Settings& settings) {
    std::vector<ArchiveEntry> entries;
    entries.reserve(settings.archive_sources.size());
    for (const auto& s : settings.archive_sources) {
        auto [path, name] = split_archive_source(s);
        entries.push_back({std::move(path), std::move(name)});
    }
    const auto out = sqsh.package_archive(entries, settings.archive_path);
    if (!settings.quiet) {
        std::cerr << GREEN << "[DONE] " << out.string() << " (" << entries.size() << " entries)" << RESET << std::endl;
    }
    return 0;
}

static int run_settings(Sqsh& sqsh, const Settings& settings) {
    SettingsPatch patch;
    patch.dark_mode = settings.dark_mode;
    patch.overwrite = settings.overwrite_setting;
    patch.convert_enabled = settings.convert_enabled;
    patch.convert_format = settings.convert_format;

    const bool changed = patch.dark_mode || patch.overwrite || patch.convert_enabled || patch.convert_format;
    const AppConfig c = changed ? sqsh.update_settings(patch) : sqsh.get_settings();

    std::cout << std::boolalpha
              << "dark_mode       " << c.dark_mode << "\n"
              << "overwrite       " << c.overwrite << "\n"
              << "convert_enabled " << c.convert_enabled << "\n"
              << "convert_format  " << c.convert_format << "\n"
              << "window          " << c.window.width << "x" << c.window.height
              << "+" << c.window.x << "+" << c.window.y << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {

    CLI::App app{"sqsh: image optimizer and converter."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, false);
        if (!fileSink->is_open()) {
            std::cerr << RED << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
        }
        Logger::add_sink(std::move(fileSink));
    }
    if (!settings.quiet) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = Logger::string_to_level(settings.log_level);
        Logger::add_sink(std::move(consoleSink));
    }

    init_utf8_locale();

    int rc = 0;
    try {
        Sqsh sqsh;
        ConsoleObserver observer(settings.quiet);
        sqsh.set_observer(&observer);
        std::jthread watcher = start_interrupt_watcher(sqsh);

        switch (settings.command) {
            case Command::Optimize:
                rc = run_optimize(sqsh, settings);
                break;
            case Command::Pack:
                rc = run_pack(sqsh, settings);
                break;
            case Command::Copy:
                sqsh.copy_file(settings.copy_source, settings.copy_destination);
                break;
            case Command::Scan:
                for (const auto& p : sqsh.scan_inputs(settings.inputs)) {
                    std::cout << p.string() << "\n";
                }
                break;
            case Command::Settings:
                rc = run_settings(sqsh, settings);
                break;
        }
        watcher = {};
        sqsh.set_observer(nullptr);
    } catch (const SqshError& e) {
        std::cerr << RED << "Error [" << error_kind_name(e.kind()) << "]: " << e.what() << RESET << std::endl;
        rc = 1;
    } catch (const std::exception& e) {
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        rc = 1;
    }

    Logger::clear_sinks();

    if (interrupted) {
        return 130; // standard exit code for SIGINT
    }
    return rc;
}
