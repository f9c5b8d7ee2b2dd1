#include "cli_parser.hpp"
#include "../../../libsqsh/include/image_format.hpp"
#include <CLI/CLI.hpp>
#include <map>

namespace {
// helper for validating a conversion target string
struct TargetFormatValidator : CLI::Validator {
    explicit TargetFormatValidator(const bool allow_same) {
        name_ = "TargetFormat";
        func_ = [allow_same](const std::string& str) {
            const auto fmt = sqsh::parse_target_format(str);
            if (!fmt || (!allow_same && *fmt == sqsh::TargetFormat::Same)) {
                return std::string("Invalid format: '") + str + "'. Must be one of: " +
                       (allow_same ? "same, " : "") + "jpg, png, webp.";
            }
            return std::string(); // ok
        };
    }
};

const std::map<std::string, bool> kBoolWords = {
    {"true", true}, {"on", true}, {"yes", true}, {"1", true},
    {"false", false}, {"off", false}, {"no", false}, {"0", false},
};

// binds a BOOL option to an optional that stays empty when the option is absent
CLI::Option* add_optional_bool(CLI::App* app, const std::string& name, std::optional<bool>& target,
                               const std::string& description) {
    return app->add_option_function<std::string>(name, [&target](const std::string& value) {
            target = kBoolWords.at(sqsh::to_lower_copy(value));
        }, description)
        ->type_name("BOOL")
        ->check(CLI::IsMember(kBoolWords, CLI::ignore_case));
}
} // namespace

std::pair<std::filesystem::path, std::string> split_archive_source(const std::string& arg) {
    const auto eq = arg.rfind('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == arg.size()) {
        const std::filesystem::path p(arg);
        return {p, p.filename().string()};
    }
    return {std::filesystem::path(arg.substr(0, eq)), arg.substr(eq + 1)};
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.require_subcommand(1);

    // --- Global options ---
    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output.");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- optimize ---
    auto* optimize = app.add_subcommand("optimize", "Optimize images, or convert them with --to.");
    optimize->add_option("inputs", settings.inputs, "Files or directories (scanned recursively).")
        ->required()
        ->check(CLI::ExistingPath);
    optimize->add_option_function<std::string>("--to", [&settings](const std::string& v) {
            settings.target_format = v;
        }, "Convert to FORMAT: same, jpg, png, webp. Default: the saved setting.")
        ->type_name("FORMAT")
        ->check(TargetFormatValidator(true));
    auto* ow = optimize->add_flag_callback("--overwrite", [&settings] { settings.overwrite = true; },
        "Replace sources (or write converted files next to them).");
    auto* no_ow = optimize->add_flag_callback("--no-overwrite", [&settings] { settings.overwrite = false; },
        "Keep sources; results stay in the temp directory unless --save is given.");
    ow->excludes(no_ow);
    optimize->add_option("--threads", settings.num_threads, "Files transformed concurrently.")
        ->default_val(4)
        ->check(CLI::PositiveNumber);
    optimize->add_option("--save", settings.save_path,
        "With --no-overwrite: copy a single result to PATH, or zip several results into PATH.");
    optimize->callback([&settings] {
        settings.command = Command::Optimize;
        if (!settings.save_path.empty() && settings.overwrite.value_or(false)) {
            throw CLI::ValidationError("--save cannot be used with --overwrite.");
        }
    });

    // --- pack ---
    auto* pack = app.add_subcommand("pack", "Bundle files into a ZIP archive (stored).");
    pack->add_option("destination", settings.archive_path, "Archive to write.")->required();
    pack->add_option("sources", settings.archive_sources, "Files to add, as PATH or PATH=NAME.")
        ->required();
    pack->callback([&settings] {
        settings.command = Command::Pack;
        for (const auto& s : settings.archive_sources) {
            if (!std::filesystem::exists(split_archive_source(s).first)) {
                throw CLI::ValidationError("Input path '" + s + "' not found.");
            }
        }
    });

    // --- copy ---
    auto* copy = app.add_subcommand("copy", "Copy a file, replacing the destination.");
    copy->add_option("source", settings.copy_source)->required()->check(CLI::ExistingFile);
    copy->add_option("destination", settings.copy_destination)->required();
    copy->callback([&settings] { settings.command = Command::Copy; });

    // --- scan ---
    auto* scan = app.add_subcommand("scan", "List the supported images found in the inputs.");
    scan->add_option("inputs", settings.inputs, "Files or directories.")->required();
    scan->callback([&settings] { settings.command = Command::Scan; });

    // --- settings ---
    auto* config = app.add_subcommand("settings", "Show or change the saved settings.");
    add_optional_bool(config, "--dark", settings.dark_mode, "Dark mode.");
    add_optional_bool(config, "--overwrite", settings.overwrite_setting, "Overwrite sources by default.");
    add_optional_bool(config, "--convert", settings.convert_enabled, "Convert by default.");
    config->add_option_function<std::string>("--format", [&settings](const std::string& v) {
            settings.convert_format = v;
        }, "Default conversion target: jpg, png, webp.")
        ->type_name("FORMAT")
        ->check(TargetFormatValidator(false));
    config->callback([&settings] { settings.command = Command::Settings; });
}
