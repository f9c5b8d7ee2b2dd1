#ifndef _WIN32
#include <magic.h>
#endif
#include "../../include/mime_detector.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/image_format.hpp"
#include "../../include/logger.hpp"
#include <memory>
#include <type_traits>

namespace {
#ifndef _WIN32
    struct MagicCloser {
        void operator()(const magic_t m) const { if (m) magic_close(m); }
    };

    using unique_magic = std::unique_ptr<std::remove_pointer_t<magic_t>, MagicCloser>;
#endif
}

std::string sqsh::MimeDetector::detect(const std::filesystem::path& path)
{
#ifndef _WIN32
    // a magic cookie is not thread-safe, so every call opens its own
    const unique_magic magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
    if (!magic) return {};
    if (magic_load(magic.get(), nullptr) != 0)
    {
        Logger::log(LogLevel::Warning,
                    std::string("magic_load failed: ") + (magic_error(magic.get()) ? magic_error(magic.get()) : "?"),
                    "mime_detector");
        return {};
    }
    const char* mime = magic_file(magic.get(), path.string().c_str());
    return mime ? mime : "";
#else
    switch (image_format_from_extension(lower_extension(path))) {
        case ImageFormat::Png:  return "image/png";
        case ImageFormat::Jpeg: return "image/jpeg";
        case ImageFormat::Webp: return "image/webp";
        default:                return "application/octet-stream";
    }
#endif
}
