#ifndef SQSH_FILE_UTILS_HPP
#define SQSH_FILE_UTILS_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace sqsh {

    /**
     * @brief RAII deleter for FILE pointers.
     */
    struct FileCloser {
        void operator()(FILE *f) const { if (f) std::fclose(f); }
    };

    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Returns the scratch directory used for staged files, creating it if needed.
     *
     * The directory lives under the system temp path ("<tmp>/sqsh"), outside
     * any source tree.
     * @throws SqshError (IOFailure) if the directory cannot be created.
     */
    std::filesystem::path scratch_dir();

    /**
     * @brief Lowercased extension of a path without the leading dot ("PNG" -> "png").
     */
    std::string lower_extension(const std::filesystem::path &path);

    /**
     * @brief Size of a regular file.
     * @throws SqshError (IOFailure) on failure.
     */
    std::uintmax_t file_size_or_throw(const std::filesystem::path &path);

    /**
     * @brief Copies a file, replacing the destination if it exists.
     * @throws SqshError (IOFailure) on failure.
     */
    void copy_file_or_throw(const std::filesystem::path &from,
                            const std::filesystem::path &to);

    /**
     * @brief Removes a file and logs (but does not throw on) errors.
     * @param path File to remove.
     * @param tag The logger tag.
     * @return true if the file no longer exists.
     */
    bool remove_file_logged(const std::filesystem::path &path,
                            std::string_view tag = "file_utils");

} // namespace sqsh

#endif // SQSH_FILE_UTILS_HPP
