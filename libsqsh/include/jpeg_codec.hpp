/**
 * @file jpeg_codec.hpp
 * @brief ICodec implementation for JPEG files (libjpeg).
 */

#ifndef SQSH_JPEG_CODEC_HPP
#define SQSH_JPEG_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <span>
#include <string_view>

namespace sqsh {

    /**
     * @brief JPEG adapter built on libjpeg.
     *
     * @details Same-format optimization is a full decode and re-encode at
     * kReencodeQuality with optimized Huffman tables. The pipeline's skip
     * policy discards the result when it is not smaller than the source.
     */
    class JpegCodec final : public ICodec {
    public:
        static constexpr int kReencodeQuality = 80;

        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "JpegCodec";
        }

        [[nodiscard]] ImageFormat get_format() const noexcept override { return ImageFormat::Jpeg; }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/jpeg", "image/pjpeg" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 4> kExts = { ".jpg", ".jpeg", ".jpe", ".jfif" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] bool can_optimize() const noexcept override { return true; }

        [[nodiscard]] bool can_decode() const noexcept override { return true; }

        [[nodiscard]] bool can_encode() const noexcept override { return true; }

        /**
         * @brief Re-encodes a JPEG at kReencodeQuality.
         * @throws std::runtime_error if libjpeg encounters a fatal error.
         */
        void optimize(const std::filesystem::path& input,
                      const std::filesystem::path& output) const override;

        /**
         * @brief Decodes to Gray (grayscale JPEGs) or Rgb.
         * @throws std::runtime_error for CMYK/YCCK images or libjpeg errors.
         */
        [[nodiscard]] PixelBuffer decode(const std::filesystem::path& input) const override;

        /**
         * @brief Encodes Gray or Rgb pixels. Buffers with alpha must be flattened first.
         */
        void encode(const PixelBuffer& image,
                    const std::filesystem::path& output,
                    int quality) const override;
    };

} // namespace sqsh

#endif // SQSH_JPEG_CODEC_HPP
