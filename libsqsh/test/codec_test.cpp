#include <array>
#include <cassert>
#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <stdexcept>

#include <png.h>

#include "../include/codec_registry.hpp"
#include "../include/jpeg_codec.hpp"
#include "../include/webp_codec.hpp"
#include "test_support.hpp"

using namespace sqsh;

static void test_registry() {
    const CodecRegistry registry;
    assert(registry.all().size() == 3);

    assert(registry.find_by_format(ImageFormat::Png)->get_name() == "PngCodec");
    assert(registry.find_by_format(ImageFormat::Jpeg)->get_name() == "JpegCodec");
    assert(registry.find_by_format(ImageFormat::Webp)->get_name() == "WebpCodec");
    assert(registry.find_by_format(ImageFormat::Unknown) == nullptr);

    assert(registry.find_by_mime("image/jpeg") == registry.find_by_format(ImageFormat::Jpeg));
    assert(registry.find_by_mime("image/webp") == registry.find_by_format(ImageFormat::Webp));
    assert(registry.find_by_mime("text/plain") == nullptr);

    assert(registry.find_by_extension(".PNG") == registry.find_by_format(ImageFormat::Png));
    assert(registry.find_by_extension(".Jpeg") == registry.find_by_format(ImageFormat::Jpeg));
    assert(registry.find_by_extension("png") == nullptr);
    assert(registry.find_by_extension(".gif") == nullptr);

    assert(!registry.find_by_format(ImageFormat::Webp)->can_optimize());
    assert(registry.find_by_format(ImageFormat::Png)->can_optimize());
}

static void test_flatten_alpha() {
    PixelBuffer in;
    in.width = 3;
    in.height = 1;
    in.mode = ColorMode::Rgba;
    in.pixels = {
        10, 20, 30, 255,  // opaque stays
        0, 0, 0, 0,       // transparent becomes white
        0, 0, 0, 128,     // half black over white
    };
    const PixelBuffer out = flatten_alpha(in);
    assert(out.mode == ColorMode::Rgb);
    assert(out.pixels.size() == 9);
    assert(out.pixels[0] == 10 && out.pixels[1] == 20 && out.pixels[2] == 30);
    assert(out.pixels[3] == 255 && out.pixels[4] == 255 && out.pixels[5] == 255);
    assert(out.pixels[6] == 127);

    PixelBuffer gray;
    gray.width = 1;
    gray.height = 1;
    gray.mode = ColorMode::GrayAlpha;
    gray.pixels = {200, 0};
    const PixelBuffer g = flatten_alpha(gray);
    assert(g.mode == ColorMode::Gray);
    assert(g.pixels.size() == 1 && g.pixels[0] == 255);

    PixelBuffer rgb = test::make_image(4, 4, false);
    assert(flatten_alpha(rgb).pixels == rgb.pixels);
}

static void test_png(const test::TempDir& dir) {
    const PngCodec png;
    const PixelBuffer img = test::make_image(17, 9, true);
    const auto path = test::write_png(dir / "codec_rgba.png", img);

    const PixelBuffer back = png.decode(path);
    assert(back.width == 17 && back.height == 9);
    assert(back.mode == ColorMode::Rgba);
    assert(back.pixels == img.pixels);

    // gray input decodes to equivalent rgba
    PixelBuffer gray;
    gray.width = 2;
    gray.height = 1;
    gray.mode = ColorMode::Gray;
    gray.pixels = {0, 200};
    png.encode(gray, dir / "codec_gray.png", 0);
    const PixelBuffer g = png.decode(dir / "codec_gray.png");
    assert(g.pixels == (std::vector<uint8_t>{0, 0, 0, 255, 200, 200, 200, 255}));

    bool threw = false;
    try {
        png.encode(PixelBuffer{}, dir / "codec_empty.png", 0);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

// smallest header-only ICC profile libpng accepts: monitor class, XYZ PCS, D50
static std::array<png_byte, 132> make_icc_profile(const char* space) {
    std::array<png_byte, 132> icc{};
    const auto put32 = [&icc](const size_t at, const uint32_t v) {
        icc[at] = static_cast<png_byte>(v >> 24);
        icc[at + 1] = static_cast<png_byte>(v >> 16);
        icc[at + 2] = static_cast<png_byte>(v >> 8);
        icc[at + 3] = static_cast<png_byte>(v);
    };
    put32(0, 132);
    put32(8, 0x02100000);
    std::memcpy(&icc[12], "mntr", 4);
    std::memcpy(&icc[16], space, 4);
    std::memcpy(&icc[20], "XYZ ", 4);
    std::memcpy(&icc[36], "acsp", 4);
    put32(68, 0x0000F6D6);
    put32(72, 0x00010000);
    put32(76, 0x0000D32D);
    return icc;
}

// RGB PNG with an iCCP chunk whose pixels are all gray
static void write_rgb_png_with_icc(const std::filesystem::path& path) {
    FILE* fp = std::fopen(path.string().c_str(), "wb");
    assert(fp);
    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    png_infop info = png_create_info_struct(png);
    assert(png && info);
    if (setjmp(png_jmpbuf(png))) {
        assert(false && "libpng failed writing the fixture");
    }
    png_init_io(png, fp);
    constexpr png_uint_32 size = 16;
    png_set_IHDR(png, info, size, size, 8, PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
    const auto icc = make_icc_profile("RGB ");
    png_set_iCCP(png, info, "fixture", PNG_COMPRESSION_TYPE_BASE, icc.data(), static_cast<png_uint_32>(icc.size()));
    png_set_compression_level(png, 0);
    png_write_info(png, info);
    std::vector<png_byte> row(size * 3);
    for (png_uint_32 y = 0; y < size; ++y) {
        for (png_uint_32 x = 0; x < size; ++x) {
            const auto v = static_cast<png_byte>((x + y) * 8);
            row[x * 3] = row[x * 3 + 1] = row[x * 3 + 2] = v;
        }
        png_write_row(png, row.data());
    }
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    std::fclose(fp);
}

struct PngHeader {
    int color_type = -1;
    bool has_icc = false;
    std::string icc_bytes;
};

static PngHeader read_png_header(const std::filesystem::path& path) {
    FILE* fp = std::fopen(path.string().c_str(), "rb");
    assert(fp);
    png_structp png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    png_infop info = png_create_info_struct(png);
    assert(png && info);
    if (setjmp(png_jmpbuf(png))) {
        assert(false && "libpng failed reading the result");
    }
    png_init_io(png, fp);
    png_read_info(png, info);

    PngHeader header;
    header.color_type = png_get_color_type(png, info);
    if (png_get_valid(png, info, PNG_INFO_iCCP)) {
        png_charp name = nullptr;
        int comp = 0;
        png_bytep profile = nullptr;
        png_uint_32 len = 0;
        if (png_get_iCCP(png, info, &name, &comp, &profile, &len)) {
            header.has_icc = true;
            header.icc_bytes.assign(reinterpret_cast<const char*>(profile), len);
        }
    }
    png_destroy_read_struct(&png, &info, nullptr);
    std::fclose(fp);
    return header;
}

static void test_png_keeps_color_profile(const test::TempDir& dir) {
    const auto src = dir / "codec_icc.png";
    write_rgb_png_with_icc(src);
    const PngHeader before = read_png_header(src);
    assert(before.has_icc);
    assert(before.color_type == PNG_COLOR_TYPE_RGB);

    PngCodec().optimize(src, dir / "codec_icc_opt.png");
    const PngHeader after = read_png_header(dir / "codec_icc_opt.png");
    // gray pixels, but the RGB profile needs a colour type
    assert(after.color_type & PNG_COLOR_MASK_COLOR);
    assert(after.has_icc);
    assert(after.icc_bytes == before.icc_bytes);

    // without a profile the same pixels still reduce to gray
    test::write_png(dir / "codec_gray_plain.png", PngCodec().decode(src));
    assert(read_png_header(dir / "codec_gray_plain.png").color_type == PNG_COLOR_TYPE_GRAY);
}

static void test_jpeg(const test::TempDir& dir) {
    const JpegCodec jpeg;
    const PixelBuffer img = test::make_image(33, 21, false);
    jpeg.encode(img, dir / "codec.jpg", 90);

    const PixelBuffer back = jpeg.decode(dir / "codec.jpg");
    assert(back.width == 33 && back.height == 21);
    assert(back.mode == ColorMode::Rgb);
    assert(back.pixels.size() == img.pixels.size());

    // alpha must be flattened by the caller
    bool threw = false;
    try {
        jpeg.encode(test::make_image(4, 4, true), dir / "codec_alpha.jpg", 80);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    jpeg.optimize(dir / "codec.jpg", dir / "codec_opt.jpg");
    const PixelBuffer opt = jpeg.decode(dir / "codec_opt.jpg");
    assert(opt.width == 33 && opt.height == 21);

    test::write_bytes(dir / "codec_bad.jpg", "\xFF\xD8\xFF garbage");
    threw = false;
    try {
        (void)jpeg.decode(dir / "codec_bad.jpg");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

static void test_webp(const test::TempDir& dir) {
    const WebpCodec webp;
    webp.encode(test::make_image(24, 16, true), dir / "codec_alpha.webp", 80);
    const PixelBuffer a = webp.decode(dir / "codec_alpha.webp");
    assert(a.width == 24 && a.height == 16);
    assert(a.mode == ColorMode::Rgba);

    webp.encode(test::make_image(24, 16, false), dir / "codec_rgb.webp", 80);
    const PixelBuffer b = webp.decode(dir / "codec_rgb.webp");
    assert(b.width == 24 && b.height == 16);
    assert(!has_alpha(b.mode));

    bool threw = false;
    try {
        webp.optimize(dir / "codec_rgb.webp", dir / "codec_out.webp");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    std::cout << "[Test] Starting Codec Test..." << std::endl;

    test::TempDir dir("sqsh_codec");
    test_registry();
    test_flatten_alpha();
    test_png(dir);
    test_png_keeps_color_profile(dir);
    test_jpeg(dir);
    test_webp(dir);

    std::cout << "[PASS] Codec Test." << std::endl;
    return 0;
}
