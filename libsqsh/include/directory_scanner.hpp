#ifndef SQSH_DIRECTORY_SCANNER_HPP
#define SQSH_DIRECTORY_SCANNER_HPP

#include <filesystem>
#include <vector>

namespace sqsh {

    /**
     * @brief True for OS metadata files (AppleDouble "._*", .DS_Store, desktop.ini).
     */
    bool is_junk_file(const std::filesystem::path& p);

    /**
     * @brief True if the extension is png, jpg, jpeg or webp (case-insensitive).
     */
    bool has_supported_extension(const std::filesystem::path& p);

    /**
     * @brief Expands a mixed list of files and directories into supported raster files.
     *
     * Directories are walked recursively; their files are sorted by path.
     * Inputs keep their order, missing inputs are logged and skipped, and
     * duplicates are not removed.
     */
    std::vector<std::filesystem::path>
    collect_input_files(const std::vector<std::filesystem::path>& inputs);

} // namespace sqsh

#endif // SQSH_DIRECTORY_SCANNER_HPP
