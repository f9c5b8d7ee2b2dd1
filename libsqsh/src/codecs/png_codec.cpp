#include "../../include/png_codec.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <zlib.h>
#include <cstdint>
#include <cstring>
#include <map>
#include <optional>
#include <stdexcept>
#include <vector>

namespace sqsh {

namespace {

    /**
     * @brief libpng error handler that throws a C++ exception.
     * @param msg The error message from libpng.
     */
    void png_error_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Error, std::string("libpng: ") + msg, "libpng");
        throw std::runtime_error(msg);
    }

    void png_warning_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
    }

    /**
     * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
     * Ensures png_destroy_read_struct is called even if exceptions occur.
     */
    struct PngRead {
        png_structp png = nullptr;
        png_infop info = nullptr;

        explicit PngRead() = default;

        ~PngRead() {
            if (png || info) png_destroy_read_struct(&png, &info, nullptr);
        }
    };

    /**
     * @brief RAII wrapper for libpng write structs (png_structp, png_infop).
     */
    struct PngWrite {
        png_structp png = nullptr;
        png_infop info = nullptr;

        explicit PngWrite() = default;

        ~PngWrite() {
            if (png || info) png_destroy_write_struct(&png, &info);
        }
    };

    /**
     * @brief Prepares a reader on an open file and parses the header chunks.
     */
    void open_reader(PngRead& rd, FILE* fp, const char* stage) {
        rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
        if (!rd.png) throw std::runtime_error(std::string("png_create_read_struct failed (") + stage + ")");
        png_set_error_fn(rd.png, nullptr, png_error_fn, png_warning_fn);

        rd.info = png_create_info_struct(rd.png);
        if (!rd.info) throw std::runtime_error(std::string("png_create_info_struct failed (") + stage + ")");

        // png_error_fn throws, so libpng never longjmps back here

        png_init_io(rd.png, fp);
        png_read_info(rd.png, rd.info);
    }

    /**
     * @brief Copies colour-management, physical size, text and time chunks.
     *
     * Must be called before png_write_info(). Palette-dependent chunks
     * (bKGD, sBIT) are not copied because the output colour type may differ.
     */
    void copy_metadata(png_structp in_png, png_infop in_info,
                       png_structp out_png, png_infop out_info) {
        if (png_get_valid(in_png, in_info, PNG_INFO_iCCP)) {
            png_charp name = nullptr;
            int comp_type = 0;
            png_bytep profile = nullptr;
            png_uint_32 profile_len = 0;
            if (png_get_iCCP(in_png, in_info, &name, &comp_type, &profile, &profile_len)) {
                png_set_iCCP(out_png, out_info, name, comp_type, profile, profile_len);
            }
        }
        if (png_get_valid(in_png, in_info, PNG_INFO_sRGB)) {
            int intent = 0;
            if (png_get_sRGB(in_png, in_info, &intent)) {
                png_set_sRGB(out_png, out_info, intent);
            }
        }
        if (png_get_valid(in_png, in_info, PNG_INFO_gAMA)) {
            double gamma = 0.0;
            if (png_get_gAMA(in_png, in_info, &gamma)) {
                png_set_gAMA(out_png, out_info, gamma);
            }
        }
        if (png_get_valid(in_png, in_info, PNG_INFO_cHRM)) {
            double wx, wy, rx, ry, gx, gy, bx, by;
            if (png_get_cHRM(in_png, in_info, &wx, &wy, &rx, &ry, &gx, &gy, &bx, &by)) {
                png_set_cHRM(out_png, out_info, wx, wy, rx, ry, gx, gy, bx, by);
            }
        }
        if (png_get_valid(in_png, in_info, PNG_INFO_pHYs)) {
            png_uint_32 xppu = 0, yppu = 0;
            int unit = 0;
            if (png_get_pHYs(in_png, in_info, &xppu, &yppu, &unit)) {
                png_set_pHYs(out_png, out_info, xppu, yppu, unit);
            }
        }

        png_textp text = nullptr;
        int num_text = 0;
        png_get_text(in_png, in_info, &text, &num_text);
        if (num_text > 0 && text) {
            png_set_text(out_png, out_info, text, num_text);
        }

        if (png_get_valid(in_png, in_info, PNG_INFO_tIME)) {
            png_timep mod_time = nullptr;
            if (png_get_tIME(in_png, in_info, &mod_time)) {
                png_set_tIME(out_png, out_info, mod_time);
            }
        }
    }

    enum class IccSpace { None, Gray, Color };

    /**
     * @brief Data colour space of the source's iCCP profile.
     *
     * libpng only accepts a gray profile on gray outputs and a colour profile
     * on colour outputs (palette included), so the writer picks a colour type
     * that keeps the profile.
     */
    IccSpace icc_space(png_structp png, png_infop info) {
        if (!png_get_valid(png, info, PNG_INFO_iCCP)) return IccSpace::None;
        png_charp name = nullptr;
        int comp_type = 0;
        png_bytep profile = nullptr;
        png_uint_32 profile_len = 0;
        if (!png_get_iCCP(png, info, &name, &comp_type, &profile, &profile_len) || !profile || profile_len < 20) {
            return IccSpace::None;
        }
        // ICC header: data colour space signature at offset 16
        return std::memcmp(profile + 16, "GRAY", 4) == 0 ? IccSpace::Gray : IccSpace::Color;
    }

    inline uint32_t pack_rgba(const unsigned char r, const unsigned char g,
                              const unsigned char b, const unsigned char a) {
        return (static_cast<uint32_t>(r) << 24) |
               (static_cast<uint32_t>(g) << 16) |
               (static_cast<uint32_t>(b) << 8)  |
               (static_cast<uint32_t>(a));
    }

    /**
     * @brief Reads and decodes an opened PNG into an 8-bit RGBA buffer.
     */
    std::vector<unsigned char> read_to_rgba8(png_structp png, png_infop info,
                                             png_uint_32& width, png_uint_32& height) {
        int bit_depth, color_type;
        png_get_IHDR(png, info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

        if (bit_depth == 16) png_set_strip_16(png);
        if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png);
        if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(png);
        if (png_get_valid(png, info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(png);
        if (!(color_type & PNG_COLOR_MASK_ALPHA)) png_set_filler(png, 0xFF, PNG_FILLER_AFTER);
        if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(png);
        png_set_interlace_handling(png);

        png_read_update_info(png, info);

        const size_t rowbytes = png_get_rowbytes(png, info);
        if (rowbytes != static_cast<size_t>(width) * 4) {
             throw std::runtime_error("Rowbytes mismatch, expected RGBA8");
        }

        std::vector<unsigned char> image(rowbytes * height);
        std::vector<png_bytep> row_pointers(height);
        for (png_uint_32 y = 0; y < height; ++y) {
            row_pointers[y] = image.data() + y * rowbytes;
        }

        png_read_image(png, row_pointers.data());
        png_read_end(png, info);

        return image;
    }

    /**
     * @brief Expands any PixelBuffer layout to tightly packed RGBA8.
     */
    std::vector<unsigned char> to_rgba8(const PixelBuffer& image) {
        const size_t count = static_cast<size_t>(image.width) * image.height;
        if (image.pixels.size() < count * channel_count(image.mode)) {
            throw std::runtime_error("Pixel buffer is smaller than its dimensions");
        }
        if (image.mode == ColorMode::Rgba) {
            return {image.pixels.begin(), image.pixels.begin() + static_cast<std::ptrdiff_t>(count * 4)};
        }

        std::vector<unsigned char> out(count * 4);
        const unsigned char* src = image.pixels.data();
        unsigned char* dst = out.data();
        for (size_t i = 0; i < count; ++i, dst += 4) {
            switch (image.mode) {
                case ColorMode::Gray:
                    dst[0] = dst[1] = dst[2] = src[0];
                    dst[3] = 0xFF;
                    src += 1;
                    break;
                case ColorMode::GrayAlpha:
                    dst[0] = dst[1] = dst[2] = src[0];
                    dst[3] = src[1];
                    src += 2;
                    break;
                case ColorMode::Rgb:
                    dst[0] = src[0];
                    dst[1] = src[1];
                    dst[2] = src[2];
                    dst[3] = 0xFF;
                    src += 3;
                    break;
                case ColorMode::Rgba:
                    break;
            }
        }
        return out;
    }

    /**
     * @brief Writes an RGBA8 buffer using the smallest exact colour type.
     * @param meta_source Optional PNG whose ancillary chunks are carried over.
     */
    void write_reduced_png(const std::vector<unsigned char>& rgba_buffer,
                           const png_uint_32 width, const png_uint_32 height,
                           const std::filesystem::path& output,
                           const std::optional<std::filesystem::path>& meta_source) {
        // analyze the in-memory buffer
        bool all_gray = true;
        bool all_opaque = true;
        bool can_use_palette = true;
        std::map<uint32_t, uint8_t> color_to_index_map;
        std::vector<png_color> palette;
        std::vector<png_byte> transparency;

        const unsigned char* p = rgba_buffer.data();
        for (png_uint_32 y = 0; y < height; ++y) {
            for (png_uint_32 x = 0; x < width; ++x) {
                const unsigned char r = p[0], g = p[1], b = p[2], a = p[3];

                if (r != g || g != b) all_gray = false;
                if (a != 0xFF) all_opaque = false;

                if (can_use_palette) {
                    const uint32_t color = pack_rgba(r, g, b, a);
                    if (!color_to_index_map.contains(color)) {
                        if (color_to_index_map.size() >= 256) {
                            can_use_palette = false;
                        } else {
                            const auto index = static_cast<uint8_t>(color_to_index_map.size());
                            color_to_index_map[color] = index;
                            palette.push_back({r, g, b});
                            transparency.push_back(a);
                        }
                    }
                }
                p += 4;
            }
        }

        const unique_FILE fp_out(open_file(output, "wb"));
        if (!fp_out) {
            Logger::log(LogLevel::Error, "Cannot open PNG output: " + output.string(), "png_codec");
            throw std::runtime_error("Cannot open PNG output");
        }

        PngWrite wr;
        wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
        if (!wr.png) throw std::runtime_error("png_create_write_struct failed");
        png_set_error_fn(wr.png, nullptr, png_error_fn, png_warning_fn);
        wr.info = png_create_info_struct(wr.png);
        if (!wr.info) throw std::runtime_error("png_create_info_struct failed (writer)");
        if (setjmp(png_jmpbuf(wr.png))) throw std::runtime_error("libpng write error");

        png_init_io(wr.png, fp_out.get());

        png_set_compression_level(wr.png, 9);
        png_set_compression_mem_level(wr.png, 9);
        png_set_compression_strategy(wr.png, Z_DEFAULT_STRATEGY);
        png_set_filter(wr.png, PNG_FILTER_TYPE_BASE, PNG_ALL_FILTERS);

        // the metadata reader must stay alive until png_write_info() has copied the chunks
        PngRead rd_meta;
        unique_FILE fp_meta;
        if (meta_source) {
            fp_meta.reset(open_file(*meta_source, "rb"));
            if (fp_meta) {
                open_reader(rd_meta, fp_meta.get(), "meta");
                const IccSpace space = icc_space(rd_meta.png, rd_meta.info);
                if (space == IccSpace::Color && all_gray) {
                    Logger::log(LogLevel::Debug, "Colour ICC profile present, keeping a colour type", "png_codec");
                    all_gray = false;
                } else if (space == IccSpace::Gray && all_gray) {
                    can_use_palette = false;
                }
            }
        }

        // gray is cheaper than a palette when there is no transparency to carry
        int out_color_type;
        if (all_gray && all_opaque) {
            out_color_type = PNG_COLOR_TYPE_GRAY;
        } else if (can_use_palette) {
            out_color_type = PNG_COLOR_TYPE_PALETTE;
        } else if (all_gray) {
            out_color_type = PNG_COLOR_TYPE_GA;
        } else if (all_opaque) {
            out_color_type = PNG_COLOR_TYPE_RGB;
        } else {
            out_color_type = PNG_COLOR_TYPE_RGBA;
        }

        png_set_IHDR(wr.png, wr.info, width, height, 8, out_color_type,
                     PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);

        if (out_color_type == PNG_COLOR_TYPE_PALETTE) {
            png_set_PLTE(wr.png, wr.info, palette.data(), static_cast<int>(palette.size()));
            if (!all_opaque) {
                png_set_tRNS(wr.png, wr.info, transparency.data(), static_cast<int>(transparency.size()), nullptr);
            }
        }

        if (fp_meta) {
            copy_metadata(rd_meta.png, rd_meta.info, wr.png, wr.info);
        }

        png_write_info(wr.png, wr.info);

        const png_size_t out_channels = png_get_channels(wr.png, wr.info);
        std::vector<unsigned char> out_rowbuf(static_cast<size_t>(width) * out_channels);
        png_bytep out_row = out_rowbuf.data();

        p = rgba_buffer.data();
        for (png_uint_32 y = 0; y < height; ++y) {
            const unsigned char *src = p;
            unsigned char *dst = out_row;

            if (out_color_type == PNG_COLOR_TYPE_PALETTE) {
                for (png_uint_32 x = 0; x < width; ++x) {
                    dst[0] = color_to_index_map.at(pack_rgba(src[0], src[1], src[2], src[3]));
                    src += 4;
                    dst += 1;
                }
            } else if (out_color_type == PNG_COLOR_TYPE_GRAY) {
                for (png_uint_32 x = 0; x < width; ++x) {
                    dst[0] = src[0];
                    src += 4;
                    dst += 1;
                }
            } else if (out_color_type == PNG_COLOR_TYPE_GA) {
                for (png_uint_32 x = 0; x < width; ++x) {
                    dst[0] = src[0];
                    dst[1] = src[3];
                    src += 4;
                    dst += 2;
                }
            } else if (out_color_type == PNG_COLOR_TYPE_RGB) {
                for (png_uint_32 x = 0; x < width; ++x) {
                    dst[0] = src[0];
                    dst[1] = src[1];
                    dst[2] = src[2];
                    src += 4;
                    dst += 3;
                }
            } else {
                std::memcpy(dst, src, static_cast<size_t>(width) * 4);
            }

            png_write_row(wr.png, out_row);
            p += static_cast<size_t>(width) * 4;
        }

        png_write_end(wr.png, wr.info);

        if (std::fflush(fp_out.get()) != 0) {
            throw std::runtime_error("Cannot flush PNG output");
        }
    }

} // namespace

void PngCodec::optimize(const std::filesystem::path& input,
                        const std::filesystem::path& output) const {
    Logger::log(LogLevel::Info, "Start PNG optimization: " + input.string(), "png_codec");

    const unique_FILE fp_in(open_file(input, "rb"));
    if (!fp_in) {
        Logger::log(LogLevel::Error, "Cannot open PNG input: " + input.string(), "png_codec");
        throw std::runtime_error("Cannot open PNG input");
    }

    PngRead rd;
    open_reader(rd, fp_in.get(), "optimize");

    if (png_get_bit_depth(rd.png, rd.info) == 16) {
        // reducing to 8 bits would lose precision
        Logger::log(LogLevel::Info, "16-bit PNG, copying through unchanged: " + input.string(), "png_codec");
        std::error_code ec;
        std::filesystem::copy_file(input, output, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            throw std::runtime_error("Failed to copy 16-bit PNG: " + ec.message());
        }
        return;
    }

    png_uint_32 width, height;
    const std::vector<unsigned char> rgba = read_to_rgba8(rd.png, rd.info, width, height);

    write_reduced_png(rgba, width, height, output, input);

    Logger::log(LogLevel::Info, "PNG optimization completed: " + output.string(), "png_codec");
}

PixelBuffer PngCodec::decode(const std::filesystem::path& input) const {
    const unique_FILE fp_in(open_file(input, "rb"));
    if (!fp_in) {
        Logger::log(LogLevel::Error, "Cannot open PNG input: " + input.string(), "png_codec");
        throw std::runtime_error("Cannot open PNG input");
    }

    PngRead rd;
    open_reader(rd, fp_in.get(), "decode");

    PixelBuffer image;
    image.mode = ColorMode::Rgba;
    image.pixels = read_to_rgba8(rd.png, rd.info, image.width, image.height);

    Logger::log(LogLevel::Debug,
                "Decoded PNG " + std::to_string(image.width) + "x" + std::to_string(image.height),
                "png_codec");
    return image;
}

void PngCodec::encode(const PixelBuffer& image,
                      const std::filesystem::path& output,
                      [[maybe_unused]] int quality) const {
    if (image.width == 0 || image.height == 0) {
        throw std::runtime_error("Cannot encode an empty image as PNG");
    }
    write_reduced_png(to_rgba8(image), image.width, image.height, output, std::nullopt);
    Logger::log(LogLevel::Debug, "PNG encoded: " + output.string(), "png_codec");
}

} // namespace sqsh
