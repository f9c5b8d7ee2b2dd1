#include "../../include/codec_registry.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/png_codec.hpp"
#include "../../include/webp_codec.hpp"
#include <algorithm>
#include <cctype>

namespace sqsh {

CodecRegistry::CodecRegistry() {
    codecs_.push_back(std::make_unique<PngCodec>());
    codecs_.push_back(std::make_unique<JpegCodec>());
    codecs_.push_back(std::make_unique<WebpCodec>());
}

ICodec* CodecRegistry::find_by_format(const ImageFormat format) const {
    for (const auto& codec : codecs_) {
        if (codec->get_format() == format) {
            return codec.get();
        }
    }
    return nullptr;
}

ICodec* CodecRegistry::find_by_mime(const std::string& mime) const {
    for (const auto& codec : codecs_) {
        for (const auto supported_mime : codec->get_supported_mime_types()) {
            if (supported_mime == mime) {
                return codec.get();
            }
        }
    }
    return nullptr;
}

ICodec* CodecRegistry::find_by_extension(const std::string& ext) const {
    if (ext.empty() || ext[0] != '.') return nullptr;

    auto iequals = [](const std::string_view s1, const std::string_view s2) {
        return std::equal(s1.begin(), s1.end(), s2.begin(), s2.end(),
                          [](const char a, const char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    };

    for (const auto& codec : codecs_) {
        for (const auto supported_ext : codec->get_supported_extensions()) {
            if (iequals(supported_ext, ext)) {
                return codec.get();
            }
        }
    }
    return nullptr;
}

} // namespace sqsh
