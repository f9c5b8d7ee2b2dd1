#include "../../include/transform_pipeline.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/staged_write.hpp"
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace sqsh {

namespace {

// runs a codec call, reporting library failures as CodecFailure
template <typename Fn>
void run_codec(const fs::path& source, const ICodec& codec, Fn&& fn) {
    try {
        fn();
    } catch (const SqshError&) {
        throw;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error,
                    std::string(codec.get_name()) + " failed on " + source.string() + ": " + e.what(),
                    "pipeline");
        throw SqshError(ErrorKind::CodecFailure,
                        std::string(codec.get_name()) + ": " + e.what() + " (" + source.string() + ")");
    }
}

} // namespace

std::optional<TargetFormat> TransformPipeline::parse_target(const std::optional<std::string>& target) {
    if (!target) return std::nullopt;
    auto parsed = parse_target_format(*target);
    if (!parsed) {
        throw SqshError(ErrorKind::UnsupportedFormat, "Unsupported target format: " + *target);
    }
    return parsed;
}

void TransformPipeline::require_source(const fs::path& source) const {
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        Logger::log(LogLevel::Warning, "Source not found: " + source.string(), "pipeline");
        throw SqshError(ErrorKind::NotFound, "File not found: " + source.string());
    }
}

const ICodec* TransformPipeline::decoder_for(const fs::path& source) const {
    const std::string mime = MimeDetector::detect(source);
    const ICodec* codec = mime.empty() ? nullptr : registry_.find_by_mime(mime);
    if (!codec) {
        codec = registry_.find_by_extension(source.extension().string());
    }
    if (codec && codec->can_decode()) {
        return codec;
    }
    return nullptr;
}

TransformOutcome TransformPipeline::run(const fs::path& source,
                                        const bool overwrite,
                                        const std::optional<std::string>& target) const {
    require_source(source);
    return run(TransformRequest{source, overwrite, parse_target(target)});
}

TransformOutcome TransformPipeline::run(const TransformRequest& request) const {
    const fs::path& source = request.source_path;
    require_source(source);

    const std::string source_ext = lower_extension(source);
    const ImageFormat source_format = image_format_from_extension(source_ext);
    const TargetFormat target = request.target_format.value_or(TargetFormat::Same);
    const std::optional<ImageFormat> target_format = target_image_format(target);

    Logger::log(LogLevel::Debug,
                "Transform " + source.string() + " [" + image_format_to_string(source_format) +
                " -> " + target_format_to_string(target) + "]",
                "pipeline");

    // same format: optimize in place or re-encode an explicitly requested webp
    if (!target_format || *target_format == source_format) {
        const ICodec* codec = registry_.find_by_format(source_format);
        if (!codec) {
            throw SqshError(ErrorKind::UnsupportedFormat, "Unsupported source format: " + source.string());
        }

        if (codec->can_optimize()) {
            return StagedWriteCoordinator::run(source, source_ext, false, request.overwrite,
                [&](const fs::path& staged) {
                    run_codec(source, *codec, [&] { codec->optimize(source, staged); });
                });
        }

        if (target_format && codec->can_decode() && codec->can_encode()) {
            return StagedWriteCoordinator::run(source, source_ext, false, request.overwrite,
                [&](const fs::path& staged) {
                    run_codec(source, *codec, [&] {
                        codec->encode(codec->decode(source), staged, kEncodeQuality);
                    });
                });
        }

        throw SqshError(ErrorKind::UnsupportedFormat,
                        "No optimizer for " + image_format_to_string(source_format) +
                        " without an explicit target: " + source.string());
    }

    // format change
    const ICodec* decoder = decoder_for(source);
    if (!decoder) {
        throw SqshError(ErrorKind::UnsupportedFormat, "Cannot decode source: " + source.string());
    }
    const ICodec* encoder = registry_.find_by_format(*target_format);
    if (!encoder || !encoder->can_encode()) {
        throw SqshError(ErrorKind::UnsupportedFormat,
                        "No encoder for " + image_format_to_string(*target_format));
    }

    return StagedWriteCoordinator::run(source, image_format_extension(*target_format), true, request.overwrite,
        [&](const fs::path& staged) {
            PixelBuffer image;
            run_codec(source, *decoder, [&] { image = decoder->decode(source); });
            if (*target_format == ImageFormat::Jpeg) {
                image = flatten_alpha(image);
            }
            run_codec(source, *encoder, [&] { encoder->encode(image, staged, kEncodeQuality); });
        });
}

} // namespace sqsh
