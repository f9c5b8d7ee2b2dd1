#include "../../include/webp_codec.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <webp/decode.h>
#include <webp/encode.h>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace {

struct WebPFreeDeleter {
    void operator()(uint8_t* p) const { if (p) WebPFree(p); }
};

using unique_webp_buffer = std::unique_ptr<uint8_t, WebPFreeDeleter>;

// WebPPicture owner, WebPPictureFree on scope exit
struct WebpPicture {
    WebPPicture pic{};
    bool initialized = false;

    WebpPicture() {
        initialized = WebPPictureInit(&pic) != 0;
    }

    ~WebpPicture() {
        if (initialized) WebPPictureFree(&pic);
    }

    WebpPicture(const WebpPicture&) = delete;
    WebpPicture& operator=(const WebpPicture&) = delete;
};

struct WebpMemoryWriter {
    WebPMemoryWriter writer{};

    WebpMemoryWriter() { WebPMemoryWriterInit(&writer); }
    ~WebpMemoryWriter() { WebPMemoryWriterClear(&writer); }

    WebpMemoryWriter(const WebpMemoryWriter&) = delete;
    WebpMemoryWriter& operator=(const WebpMemoryWriter&) = delete;
};

std::vector<uint8_t> read_all(const std::filesystem::path& input) {
    std::ifstream file(input, std::ios::binary | std::ios::ate);
    if (!file) {
        sqsh::Logger::log(sqsh::LogLevel::Error, "Cannot open WebP input: " + input.string(), "webp_codec");
        throw std::runtime_error("Cannot open WebP input");
    }
    const std::streamsize size = file.tellg();
    if (size <= 0) {
        throw std::runtime_error("WebP input is empty");
    }
    file.seekg(0, std::ios::beg);
    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
        throw std::runtime_error("Failed to read WebP input");
    }
    return data;
}

// expands gray layouts so libwebp's RGB/RGBA importers can take them
sqsh::PixelBuffer expand_gray(const sqsh::PixelBuffer& in) {
    if (in.mode != sqsh::ColorMode::Gray && in.mode != sqsh::ColorMode::GrayAlpha) {
        return in;
    }
    const bool alpha = in.mode == sqsh::ColorMode::GrayAlpha;
    sqsh::PixelBuffer out;
    out.width = in.width;
    out.height = in.height;
    out.mode = alpha ? sqsh::ColorMode::Rgba : sqsh::ColorMode::Rgb;
    const size_t count = static_cast<size_t>(in.width) * in.height;
    const size_t src_ch = alpha ? 2 : 1;
    const size_t dst_ch = alpha ? 4 : 3;
    out.pixels.resize(count * dst_ch);
    for (size_t i = 0; i < count; ++i) {
        const uint8_t g = in.pixels[i * src_ch];
        uint8_t* d = &out.pixels[i * dst_ch];
        d[0] = d[1] = d[2] = g;
        if (alpha) d[3] = in.pixels[i * src_ch + 1];
    }
    return out;
}

} // namespace

namespace sqsh {

void WebpCodec::optimize(const std::filesystem::path& input, const std::filesystem::path&) const {
    Logger::log(LogLevel::Debug, "Same-format WebP optimization requested for " + input.string(), "webp_codec");
    throw std::runtime_error("WebP same-format optimization is not supported");
}

PixelBuffer WebpCodec::decode(const std::filesystem::path& input) const {
    const auto data = read_all(input);

    WebPBitstreamFeatures features;
    if (WebPGetFeatures(data.data(), data.size(), &features) != VP8_STATUS_OK) {
        Logger::log(LogLevel::Error, "WebP feature detection failed for: " + input.string(), "webp_codec");
        throw std::runtime_error("WebP feature detection failed");
    }
    if (features.has_animation) {
        throw std::runtime_error("Animated WebP is not supported");
    }

    int width = 0, height = 0;
    unique_webp_buffer decoded(features.has_alpha
        ? WebPDecodeRGBA(data.data(), data.size(), &width, &height)
        : WebPDecodeRGB(data.data(), data.size(), &width, &height));
    if (!decoded || width <= 0 || height <= 0) {
        Logger::log(LogLevel::Error, "WebP decode failed for: " + input.string(), "webp_codec");
        throw std::runtime_error("WebP decode failed");
    }

    PixelBuffer image;
    image.width = static_cast<uint32_t>(width);
    image.height = static_cast<uint32_t>(height);
    image.mode = features.has_alpha ? ColorMode::Rgba : ColorMode::Rgb;
    const size_t total = image.row_bytes() * image.height;
    image.pixels.assign(decoded.get(), decoded.get() + total);
    return image;
}

void WebpCodec::encode(const PixelBuffer& image,
                       const std::filesystem::path& output,
                       const int quality) const {
    if (image.width == 0 || image.height == 0) {
        throw std::runtime_error("Cannot encode an empty image as WebP");
    }
    if (image.width > WEBP_MAX_DIMENSION || image.height > WEBP_MAX_DIMENSION) {
        throw std::runtime_error("Image exceeds WebP maximum dimension");
    }
    if (image.pixels.size() < image.row_bytes() * image.height) {
        throw std::runtime_error("Pixel buffer is smaller than its dimensions");
    }

    const PixelBuffer rgb = expand_gray(image);

    WebPConfig config;
    if (!WebPConfigPreset(&config, WEBP_PRESET_DEFAULT, static_cast<float>(std::clamp(quality, 0, 100)))) {
        Logger::log(LogLevel::Error, "WebPConfigPreset failed", "webp_codec");
        throw std::runtime_error("WebPConfigPreset failed");
    }
    config.method = 6;
    if (!WebPValidateConfig(&config)) {
        throw std::runtime_error("Invalid WebP configuration");
    }

    WebpPicture picture;
    if (!picture.initialized) {
        throw std::runtime_error("WebPPictureInit failed");
    }
    picture.pic.width = static_cast<int>(rgb.width);
    picture.pic.height = static_cast<int>(rgb.height);

    const int stride = static_cast<int>(rgb.row_bytes());
    const int imported = rgb.mode == ColorMode::Rgba
        ? WebPPictureImportRGBA(&picture.pic, rgb.pixels.data(), stride)
        : WebPPictureImportRGB(&picture.pic, rgb.pixels.data(), stride);
    if (!imported) {
        Logger::log(LogLevel::Error, "WebPPictureImport failed", "webp_codec");
        throw std::runtime_error("WebPPictureImport failed");
    }

    WebpMemoryWriter writer;
    picture.pic.writer = WebPMemoryWrite;
    picture.pic.custom_ptr = &writer.writer;

    if (!WebPEncode(&config, &picture.pic)) {
        Logger::log(LogLevel::Error,
            "WebPEncode failed (error " + std::to_string(static_cast<int>(picture.pic.error_code)) + ")",
            "webp_codec");
        throw std::runtime_error("WebPEncode failed");
    }

    const unique_FILE out(open_file(output, "wb"));
    if (!out) {
        Logger::log(LogLevel::Error, "Cannot open WebP output: " + output.string(), "webp_codec");
        throw std::runtime_error("Cannot open WebP output");
    }
    if (std::fwrite(writer.writer.mem, 1, writer.writer.size, out.get()) != writer.writer.size
        || std::fflush(out.get()) != 0) {
        throw std::runtime_error("Failed to write WebP output");
    }
}

} // namespace sqsh
