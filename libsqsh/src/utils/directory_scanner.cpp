#include "../../include/directory_scanner.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/image_format.hpp"
#include "../../include/logger.hpp"
#include <algorithm>

namespace fs = std::filesystem;

namespace sqsh {

    bool is_junk_file(const fs::path& p) {
        const auto name = to_lower_copy(p.filename().string());
        return name.starts_with("._") || name == ".ds_store" || name == "desktop.ini";
    }

    bool has_supported_extension(const fs::path& p) {
        const auto ext = lower_extension(p);
        return std::ranges::find(supported_raster_extensions, ext) != supported_raster_extensions.end();
    }

    static bool accept(const fs::path& p) {
        return !is_junk_file(p) && has_supported_extension(p);
    }

    // lists one directory; a failure loses only the rest of that directory
    static void list_directory(const fs::path& dir, std::vector<fs::path>& files, std::vector<fs::path>& subdirs) {
        std::error_code ec;
        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Skipping unreadable directory: " + dir.string() + " (" + ec.message() + ")", "scanner");
            return;
        }
        for (const fs::directory_iterator end; it != end; ) {
            std::error_code type_ec;
            const bool is_link = it->is_symlink(type_ec);
            if (!is_link && it->is_directory(type_ec)) {
                subdirs.push_back(it->path());
            } else if (it->is_regular_file(type_ec) && accept(it->path())) {
                files.push_back(it->path());
            }
            it.increment(ec);
            if (ec) {
                Logger::log(LogLevel::Warning, "Stopped listing " + dir.string() + " (" + ec.message() + ")", "scanner");
                break;
            }
        }
    }

    static void walk_directory(const fs::path& root, std::vector<fs::path>& out) {
        std::vector<fs::path> found;
        std::vector<fs::path> pending{root};
        while (!pending.empty()) {
            const fs::path dir = std::move(pending.back());
            pending.pop_back();
            list_directory(dir, found, pending);
        }
        std::ranges::sort(found);
        out.insert(out.end(), found.begin(), found.end());
    }

    std::vector<fs::path> collect_input_files(const std::vector<fs::path>& inputs) {
        std::vector<fs::path> result;

        for (const auto& in : inputs) {
            std::error_code ec;
            const auto status = fs::status(in, ec);
            if (ec || !fs::exists(status)) {
                Logger::log(LogLevel::Error, "Input not found: " + in.string(), "scanner");
                continue;
            }
            if (fs::is_directory(status)) {
                walk_directory(in, result);
            } else if (fs::is_regular_file(status) && accept(in)) {
                result.push_back(in);
            } else {
                Logger::log(LogLevel::Debug, "Ignoring unsupported input: " + in.string(), "scanner");
            }
        }

        Logger::log(LogLevel::Info,
                    "Scanner collected " + std::to_string(result.size()) + " files",
                    "scanner");
        return result;
    }

} // namespace sqsh
