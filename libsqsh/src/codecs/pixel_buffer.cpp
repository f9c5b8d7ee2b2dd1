#include "../../include/codec.hpp"

namespace sqsh {

PixelBuffer flatten_alpha(const PixelBuffer& in) {
    if (!has_alpha(in.mode)) {
        return in;
    }

    const bool gray = in.mode == ColorMode::GrayAlpha;
    PixelBuffer out;
    out.width = in.width;
    out.height = in.height;
    out.mode = gray ? ColorMode::Gray : ColorMode::Rgb;

    const size_t count = static_cast<size_t>(in.width) * in.height;
    const size_t src_ch = channel_count(in.mode);
    const size_t dst_ch = channel_count(out.mode);
    out.pixels.resize(count * dst_ch);

    for (size_t i = 0; i < count; ++i) {
        const std::uint8_t* s = &in.pixels[i * src_ch];
        std::uint8_t* d = &out.pixels[i * dst_ch];
        const unsigned a = s[src_ch - 1];
        // c*a + 255*(255-a), rounded
        for (size_t c = 0; c < dst_ch; ++c) {
            d[c] = static_cast<std::uint8_t>((s[c] * a + 255u * (255u - a) + 127u) / 255u);
        }
    }
    return out;
}

} // namespace sqsh
