/**
 * @file webp_codec.hpp
 * @brief ICodec implementation for WebP files (libwebp).
 */

#ifndef SQSH_WEBP_CODEC_HPP
#define SQSH_WEBP_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <span>
#include <string_view>

namespace sqsh {

    /**
     * @brief WebP adapter built on libwebp.
     *
     * @details Encoding is lossy at the requested quality. There is no
     * dedicated optimizer: a WebP source is only re-encoded when webp is
     * requested explicitly as the target.
     */
    class WebpCodec final : public ICodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "WebpCodec";
        }

        [[nodiscard]] ImageFormat get_format() const noexcept override { return ImageFormat::Webp; }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/webp", "image/x-webp" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".webp" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] bool can_optimize() const noexcept override { return false; }

        [[nodiscard]] bool can_decode() const noexcept override { return true; }

        [[nodiscard]] bool can_encode() const noexcept override { return true; }

        /// @throws std::runtime_error always; see can_optimize().
        void optimize(const std::filesystem::path& input,
                      const std::filesystem::path& output) const override;

        /**
         * @brief Decodes to Rgba when the bitstream has alpha, Rgb otherwise.
         */
        [[nodiscard]] PixelBuffer decode(const std::filesystem::path& input) const override;

        void encode(const PixelBuffer& image,
                    const std::filesystem::path& output,
                    int quality) const override;
    };

} // namespace sqsh

#endif // SQSH_WEBP_CODEC_HPP
