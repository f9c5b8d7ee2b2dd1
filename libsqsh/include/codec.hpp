/**
 * @file codec.hpp
 * @brief Interface implemented by every raster codec adapter.
 */

#ifndef SQSH_CODEC_HPP
#define SQSH_CODEC_HPP

#include "image_format.hpp"
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

/**
 * @namespace sqsh
 * @brief The main namespace of the sqsh library.
 *
 * @details Holds the codec adapters (PngCodec, JpegCodec, WebpCodec),
 * the per-file transform pipeline and its staged-write policy, the
 * archive packager, the directory scanner, the window geometry manager,
 * configuration persistence and the supporting utilities.
 */
namespace sqsh {

/**
 * @brief Channel layout of a decoded pixel buffer (8 bits per channel).
 */
enum class ColorMode {
    Gray,
    GrayAlpha,
    Rgb,
    Rgba
};

constexpr unsigned channel_count(const ColorMode mode) noexcept {
    switch (mode) {
        case ColorMode::Gray:      return 1;
        case ColorMode::GrayAlpha: return 2;
        case ColorMode::Rgb:       return 3;
        case ColorMode::Rgba:      return 4;
    }
    return 0;
}

constexpr bool has_alpha(const ColorMode mode) noexcept {
    return mode == ColorMode::GrayAlpha || mode == ColorMode::Rgba;
}

/**
 * @brief Decoded image, rows packed top to bottom without padding.
 */
struct PixelBuffer {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    ColorMode mode = ColorMode::Rgba;
    std::vector<std::uint8_t> pixels; ///< width * height * channel_count(mode) bytes

    [[nodiscard]] std::size_t row_bytes() const noexcept {
        return static_cast<std::size_t>(width) * channel_count(mode);
    }
};

/**
 * @brief Composites alpha onto a white background and drops the alpha channel.
 *
 * Rgba becomes Rgb, GrayAlpha becomes Gray. Buffers without alpha are
 * returned unchanged. Used before encoding to formats that cannot carry
 * transparency.
 */
PixelBuffer flatten_alpha(const PixelBuffer& in);

/**
 * @brief Adapter around a third-party codec library for one raster format.
 *
 * Implementations are stateless regarding the files they process and may
 * be called concurrently from several threads.
 */
class ICodec {
public:
    virtual ~ICodec() = default;

    // --- self-description ---

    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    [[nodiscard]] virtual ImageFormat get_format() const noexcept = 0;

    /// @return List of supported MIME types (e.g. "image/png").
    [[nodiscard]] virtual std::span<const std::string_view>
    get_supported_mime_types() const noexcept = 0;

    /// @return List of supported file extensions, with dot (e.g. ".png").
    [[nodiscard]] virtual std::span<const std::string_view>
    get_supported_extensions() const noexcept = 0;

    // --- capabilities ---

    /// @return True if the codec can re-optimize a file of its own format.
    [[nodiscard]] virtual bool can_optimize() const noexcept = 0;

    [[nodiscard]] virtual bool can_decode() const noexcept = 0;

    [[nodiscard]] virtual bool can_encode() const noexcept = 0;

    // --- operations ---

    /**
     * @brief Same-format optimization: reads input, writes an optimized file to output.
     * @throws std::runtime_error on codec failure.
     */
    virtual void optimize(const std::filesystem::path& input,
                          const std::filesystem::path& output) const = 0;

    /**
     * @brief Decodes a file into 8-bit pixels.
     * @throws std::runtime_error on codec failure.
     */
    [[nodiscard]] virtual PixelBuffer decode(const std::filesystem::path& input) const = 0;

    /**
     * @brief Encodes pixels into a file of this codec's format.
     * @param image Pixel data. Codecs that cannot store alpha expect it flattened.
     * @param output Destination path.
     * @param quality 0-100 quality for lossy formats, ignored by lossless ones.
     * @throws std::runtime_error on codec failure.
     */
    virtual void encode(const PixelBuffer& image,
                        const std::filesystem::path& output,
                        int quality) const = 0;
};

} // namespace sqsh

#endif // SQSH_CODEC_HPP
