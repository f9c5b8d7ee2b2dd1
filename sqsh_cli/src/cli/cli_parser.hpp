#ifndef SQSH_CLI_PARSER_HPP
#define SQSH_CLI_PARSER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; class Option; }

enum class Command {
    Optimize,
    Pack,
    Copy,
    Scan,
    Settings
};

struct Settings {
    Command command = Command::Optimize;

    // global
    bool quiet = false;
    std::string log_level = "ERROR";
    std::filesystem::path log_file;

    // optimize / scan
    std::vector<std::filesystem::path> inputs;
    std::optional<std::string> target_format;  ///< --to
    std::optional<bool> overwrite;             ///< --overwrite / --no-overwrite
    unsigned num_threads = 4;
    std::filesystem::path save_path;           ///< --save

    // pack
    std::filesystem::path archive_path;
    std::vector<std::string> archive_sources;  ///< "src" or "src=name"

    // copy
    std::filesystem::path copy_source;
    std::filesystem::path copy_destination;

    // settings
    std::optional<bool> dark_mode;
    std::optional<bool> overwrite_setting;
    std::optional<bool> convert_enabled;
    std::optional<std::string> convert_format;
};

/**
 * @brief Configures the CLI11 parser with subcommands, options and flags.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

/**
 * @brief Splits a "path=name" pack argument. Without '=' the name is the file name.
 */
std::pair<std::filesystem::path, std::string> split_archive_source(const std::string& arg);

#endif // SQSH_CLI_PARSER_HPP
