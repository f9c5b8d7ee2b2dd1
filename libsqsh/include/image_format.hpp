/**
 * @file image_format.hpp
 * @brief Raster formats known to sqsh and conversions between enums,
 * MIME types, extensions and user-facing strings.
 */

#ifndef SQSH_IMAGE_FORMAT_HPP
#define SQSH_IMAGE_FORMAT_HPP

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sqsh {

/**
 * @brief Raster formats the codecs can read or write.
 */
enum class ImageFormat {
    Png,
    Jpeg,
    Webp,
    Unknown
};

/**
 * @brief Transform requested for a file.
 *
 * Same means "optimize in the source's own format"; the others are
 * explicit conversion targets.
 */
enum class TargetFormat {
    Same,
    Jpg,
    Webp,
    Png
};

///< Map linking MIME type strings to their corresponding ImageFormat.
inline const std::unordered_map<std::string, ImageFormat> mime_to_image_format = {
    { "image/png",   ImageFormat::Png },
    { "image/apng",  ImageFormat::Png },
    { "image/jpeg",  ImageFormat::Jpeg },
    { "image/pjpeg", ImageFormat::Jpeg },
    { "image/webp",  ImageFormat::Webp },
    { "image/x-webp", ImageFormat::Webp },
};

///< Extensions (lowercase, without dot) picked up by the directory scanner.
inline constexpr std::array<std::string_view, 4> supported_raster_extensions = {
    "png", "jpg", "jpeg", "webp"
};

inline std::string to_lower_copy(std::string s) {
    std::ranges::transform(s, s.begin(),
        [](const unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

/**
 * @brief Canonical file extension (without dot) written for a format.
 */
inline std::string image_format_extension(const ImageFormat fmt) {
    switch (fmt) {
        case ImageFormat::Png:  return "png";
        case ImageFormat::Jpeg: return "jpg";
        case ImageFormat::Webp: return "webp";
        default:                return "";
    }
}

inline std::string image_format_to_string(const ImageFormat fmt) {
    switch (fmt) {
        case ImageFormat::Png:  return "PNG";
        case ImageFormat::Jpeg: return "JPEG";
        case ImageFormat::Webp: return "WebP";
        default:                return "unknown";
    }
}

/**
 * @brief Maps a file extension to an ImageFormat.
 *
 * Case-insensitive, leading dot optional ("JPEG", ".jpg" and "jpe" all map to Jpeg).
 * @return ImageFormat::Unknown for anything outside the supported set.
 */
inline ImageFormat image_format_from_extension(const std::string& ext) {
    std::string s = to_lower_copy(ext);
    if (!s.empty() && s.front() == '.') s.erase(0, 1);

    if (s == "png" || s == "apng") return ImageFormat::Png;
    if (s == "jpg" || s == "jpeg" || s == "jpe" || s == "jfif") return ImageFormat::Jpeg;
    if (s == "webp") return ImageFormat::Webp;
    return ImageFormat::Unknown;
}

inline ImageFormat image_format_from_mime(const std::string& mime) {
    const auto it = mime_to_image_format.find(mime);
    return it != mime_to_image_format.end() ? it->second : ImageFormat::Unknown;
}

/**
 * @brief Parses a user-supplied conversion target.
 *
 * Accepts "same" (or an empty string), "jpg"/"jpeg", "png" and "webp",
 * case-insensitive.
 * @return std::nullopt for anything else.
 */
inline std::optional<TargetFormat> parse_target_format(const std::string& str) {
    const std::string s = to_lower_copy(str);
    if (s.empty() || s == "same") return TargetFormat::Same;
    if (s == "jpg" || s == "jpeg") return TargetFormat::Jpg;
    if (s == "png")  return TargetFormat::Png;
    if (s == "webp") return TargetFormat::Webp;
    return std::nullopt;
}

inline std::string target_format_to_string(const TargetFormat fmt) {
    switch (fmt) {
        case TargetFormat::Same: return "same";
        case TargetFormat::Jpg:  return "jpg";
        case TargetFormat::Webp: return "webp";
        case TargetFormat::Png:  return "png";
    }
    return "same";
}

/**
 * @brief Format produced by a conversion target, or std::nullopt for Same.
 */
inline std::optional<ImageFormat> target_image_format(const TargetFormat fmt) {
    switch (fmt) {
        case TargetFormat::Jpg:  return ImageFormat::Jpeg;
        case TargetFormat::Webp: return ImageFormat::Webp;
        case TargetFormat::Png:  return ImageFormat::Png;
        case TargetFormat::Same: break;
    }
    return std::nullopt;
}

} // namespace sqsh

#endif // SQSH_IMAGE_FORMAT_HPP
