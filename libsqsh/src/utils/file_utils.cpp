#include "../../include/file_utils.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

namespace sqsh {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        // _wfopen accepts wide-char paths (UTF-16), supporting Unicode and long paths
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        // prepend the magic prefix to bypass MAX_PATH
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::filesystem::path scratch_dir() {
        std::error_code ec;
        const auto base = std::filesystem::temp_directory_path(ec);
        if (ec) {
            throw SqshError(ErrorKind::IOFailure, "Cannot locate temp directory (" + ec.message() + ")");
        }
        auto dir = base / "sqsh";
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                "Failed to create scratch dir: " + dir.string() + " (" + ec.message() + ")",
                "file_utils");
            throw SqshError(ErrorKind::IOFailure, "Cannot create scratch directory " + dir.string());
        }
        return dir;
    }

    std::string lower_extension(const std::filesystem::path& path) {
        std::string ext = path.extension().string();
        if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
        std::ranges::transform(ext, ext.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return ext;
    }

    std::uintmax_t file_size_or_throw(const std::filesystem::path& path) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec) {
            throw SqshError(ErrorKind::IOFailure,
                            "Cannot read size of " + path.string() + " (" + ec.message() + ")");
        }
        return size;
    }

    void copy_file_or_throw(const std::filesystem::path& from, const std::filesystem::path& to) {
        std::error_code ec;
        std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                "Copy failed: " + from.string() + " -> " + to.string() + " (" + ec.message() + ")",
                "file_utils");
            throw SqshError(ErrorKind::IOFailure,
                            "Cannot copy " + from.string() + " to " + to.string() + " (" + ec.message() + ")");
        }
    }

    bool remove_file_logged(const std::filesystem::path& path, const std::string_view tag) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove file: " + path.string() + " (" + ec.message() + ")", tag);
            return false;
        }
        Logger::log(LogLevel::Debug, "Removed file: " + path.string(), tag);
        return true;
    }

} // namespace sqsh
