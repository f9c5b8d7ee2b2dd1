#include "../../include/jpeg_codec.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <jpeglib.h>
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 * @param cinfo Pointer to the libjpeg error context.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    sqsh::Logger::log(sqsh::LogLevel::Warning, std::string("libjpeg: ") + err->msg, "libjpeg");
    throw std::runtime_error(err->msg);
}

// corrupt-data warnings are routed to the debug log instead of stderr
void jpeg_output_message_log(const j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    sqsh::Logger::log(sqsh::LogLevel::Debug, std::string("libjpeg: ") + buffer, "libjpeg");
}

/**
 * @brief RAII owner of a decompression struct and its error manager.
 */
struct JpegDecompress {
    jpeg_decompress_struct info{};
    JpegErrorMgr err{};

    JpegDecompress() {
        info.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = jpeg_error_exit_throw;
        err.pub.output_message = jpeg_output_message_log;
        jpeg_create_decompress(&info);
    }

    ~JpegDecompress() { jpeg_destroy_decompress(&info); }

    JpegDecompress(const JpegDecompress&) = delete;
    JpegDecompress& operator=(const JpegDecompress&) = delete;
};

/**
 * @brief RAII owner of a compression struct and its error manager.
 */
struct JpegCompress {
    jpeg_compress_struct info{};
    JpegErrorMgr err{};

    JpegCompress() {
        info.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = jpeg_error_exit_throw;
        err.pub.output_message = jpeg_output_message_log;
        jpeg_create_compress(&info);
    }

    ~JpegCompress() { jpeg_destroy_compress(&info); }

    JpegCompress(const JpegCompress&) = delete;
    JpegCompress& operator=(const JpegCompress&) = delete;
};

} // namespace

namespace sqsh {

PixelBuffer JpegCodec::decode(const std::filesystem::path& input) const {
    const unique_FILE infile(open_file(input, "rb"));
    if (!infile) {
        Logger::log(LogLevel::Error, "Cannot open JPEG input: " + input.string(), "jpeg_codec");
        throw std::runtime_error("Cannot open JPEG input");
    }

    JpegDecompress src;
    jpeg_stdio_src(&src.info, infile.get());

    if (jpeg_read_header(&src.info, TRUE) != JPEG_HEADER_OK) {
        throw std::runtime_error("Invalid JPEG header");
    }

    if (src.info.jpeg_color_space == JCS_CMYK || src.info.jpeg_color_space == JCS_YCCK) {
        throw std::runtime_error("CMYK JPEG images are not supported");
    }

    const bool gray = src.info.jpeg_color_space == JCS_GRAYSCALE;
    src.info.out_color_space = gray ? JCS_GRAYSCALE : JCS_RGB;

    jpeg_start_decompress(&src.info);

    PixelBuffer image;
    image.width = src.info.output_width;
    image.height = src.info.output_height;
    image.mode = gray ? ColorMode::Gray : ColorMode::Rgb;

    const size_t row_stride = image.row_bytes();
    if (static_cast<size_t>(src.info.output_components) != channel_count(image.mode)) {
        throw std::runtime_error("Unexpected JPEG component count");
    }
    image.pixels.resize(row_stride * image.height);

    while (src.info.output_scanline < src.info.output_height) {
        JSAMPROW row_ptr = image.pixels.data() + static_cast<size_t>(src.info.output_scanline) * row_stride;
        jpeg_read_scanlines(&src.info, &row_ptr, 1);
    }

    jpeg_finish_decompress(&src.info);

    Logger::log(LogLevel::Debug,
                std::string("Decoded JPEG ") + (src.info.progressive_mode ? "progressive " : "baseline ") +
                std::to_string(image.width) + "x" + std::to_string(image.height),
                "jpeg_codec");
    return image;
}

void JpegCodec::encode(const PixelBuffer& image,
                       const std::filesystem::path& output,
                       const int quality) const {
    if (has_alpha(image.mode)) {
        throw std::runtime_error("JPEG cannot store alpha; flatten the image first");
    }
    if (image.width == 0 || image.height == 0) {
        throw std::runtime_error("Cannot encode an empty image as JPEG");
    }
    const size_t row_stride = image.row_bytes();
    if (image.pixels.size() < row_stride * image.height) {
        throw std::runtime_error("Pixel buffer is smaller than its dimensions");
    }

    const unique_FILE outfile(open_file(output, "wb"));
    if (!outfile) {
        Logger::log(LogLevel::Error, "Cannot open JPEG output: " + output.string(), "jpeg_codec");
        throw std::runtime_error("Cannot open JPEG output");
    }

    JpegCompress dst;
    jpeg_stdio_dest(&dst.info, outfile.get());

    dst.info.image_width = image.width;
    dst.info.image_height = image.height;
    dst.info.input_components = static_cast<int>(channel_count(image.mode));
    dst.info.in_color_space = image.mode == ColorMode::Gray ? JCS_GRAYSCALE : JCS_RGB;

    jpeg_set_defaults(&dst.info);
    jpeg_set_quality(&dst.info, std::clamp(quality, 0, 100), TRUE);
    dst.info.optimize_coding = TRUE;

    jpeg_start_compress(&dst.info, TRUE);
    while (dst.info.next_scanline < dst.info.image_height) {
        // libjpeg takes non-const rows but never writes through them
        auto row_ptr = const_cast<JSAMPROW>(image.pixels.data() + static_cast<size_t>(dst.info.next_scanline) * row_stride);
        jpeg_write_scanlines(&dst.info, &row_ptr, 1);
    }
    jpeg_finish_compress(&dst.info);

    if (std::fflush(outfile.get()) != 0) {
        throw std::runtime_error("Cannot flush JPEG output");
    }
}

void JpegCodec::optimize(const std::filesystem::path& input,
                         const std::filesystem::path& output) const {
    Logger::log(LogLevel::Info, "Start JPEG re-encode: " + input.string(), "jpeg_codec");
    encode(decode(input), output, kReencodeQuality);
    Logger::log(LogLevel::Info, "JPEG re-encode completed: " + output.string(), "jpeg_codec");
}

} // namespace sqsh
