/**
 * @file png_codec.hpp
 * @brief ICodec implementation for PNG files (libpng + zlib).
 */

#ifndef SQSH_PNG_CODEC_HPP
#define SQSH_PNG_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <span>
#include <string_view>

namespace sqsh {

    /**
     * @brief PNG adapter built on libpng.
     *
     * @details optimize() is lossless: the image is decoded to RGBA8, analyzed
     * and re-written with the smallest colour type that represents it exactly
     * (palette, gray, gray+alpha, RGB or RGBA), maximum zlib compression and
     * all row filters enabled. Colour-management and text chunks are carried
     * over. 16-bit images are copied through unchanged so no precision is lost.
     */
    class PngCodec final : public ICodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "PngCodec";
        }

        [[nodiscard]] ImageFormat get_format() const noexcept override { return ImageFormat::Png; }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/png", "image/apng" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 2> kExts = { ".png", ".apng" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] bool can_optimize() const noexcept override { return true; }

        [[nodiscard]] bool can_decode() const noexcept override { return true; }

        [[nodiscard]] bool can_encode() const noexcept override { return true; }

        /**
         * @brief Losslessly re-optimizes a PNG file.
         * @param input Path to the source PNG file.
         * @param output Path to write the optimized PNG file.
         * @throws std::runtime_error if libpng encounters a fatal error.
         */
        void optimize(const std::filesystem::path& input,
                      const std::filesystem::path& output) const override;

        /**
         * @brief Decodes any PNG (palette, gray, 16-bit, interlaced) into an Rgba buffer.
         */
        [[nodiscard]] PixelBuffer decode(const std::filesystem::path& input) const override;

        /**
         * @brief Writes pixels as PNG using the smallest exact colour type.
         * @param quality Ignored, PNG is lossless.
         */
        void encode(const PixelBuffer& image,
                    const std::filesystem::path& output,
                    int quality) const override;
    };

} // namespace sqsh

#endif // SQSH_PNG_CODEC_HPP
