#ifndef SQSH_MIME_DETECTOR_HPP
#define SQSH_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace sqsh {

    /**
     * @brief Content-based file type detection.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file from its content.
         *
         * @param path The filesystem path to the file.
         * @return A MIME type string (e.g., "image/jpeg"), or an empty string
         * if detection failed.
         *
         * @note On Linux/macOS this uses libmagic with the system database.
         * @note On Windows this falls back to the file extension.
         */
        static std::string detect(const std::filesystem::path& path);
    };

} // namespace sqsh

#endif // SQSH_MIME_DETECTOR_HPP
