/**
 * @file transform_pipeline.hpp
 * @brief Per-file optimize-or-convert operation.
 */

#ifndef SQSH_TRANSFORM_PIPELINE_HPP
#define SQSH_TRANSFORM_PIPELINE_HPP

#include "codec_registry.hpp"
#include "transform.hpp"
#include <optional>
#include <string>

namespace sqsh {

/**
 * @brief Classifies a request, runs the matching codec into a staged file
 * and applies the commit/skip policy.
 *
 * @details Dispatch on (source format by extension, target):
 * - PNG or JPEG without a format change: the codec's optimizer.
 * - WebP with webp requested explicitly: decode and re-encode.
 * - Format change: decode with the codec picked from the sniffed MIME type
 *   (extension as fallback), encode with the target codec. Alpha is
 *   flattened onto white for JPEG.
 * - Anything else: UnsupportedFormat.
 *
 * run() only reads the registry, so one pipeline may serve many threads.
 */
class TransformPipeline {
public:
    static constexpr int kEncodeQuality = 80;

    explicit TransformPipeline(const CodecRegistry& registry) : registry_(registry) {}

    /**
     * @brief Transform one file.
     * @throws SqshError NotFound, UnsupportedFormat, CodecFailure or IOFailure.
     */
    [[nodiscard]] TransformOutcome run(const TransformRequest& request) const;

    /**
     * @brief Textual variant; target is one of same/jpg/jpeg/png/webp.
     *
     * The source is checked for existence first, then the target string
     * is validated, before anything is written.
     */
    [[nodiscard]] TransformOutcome run(const std::filesystem::path& source,
                                       bool overwrite,
                                       const std::optional<std::string>& target) const;

    /**
     * @brief Parses a target string.
     * @throws SqshError (UnsupportedFormat) for unknown names.
     */
    static std::optional<TargetFormat> parse_target(const std::optional<std::string>& target);

private:
    void require_source(const std::filesystem::path& source) const;

    [[nodiscard]] const ICodec* decoder_for(const std::filesystem::path& source) const;

    const CodecRegistry& registry_;
};

} // namespace sqsh

#endif // SQSH_TRANSFORM_PIPELINE_HPP
