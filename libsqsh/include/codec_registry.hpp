/**
 * @file codec_registry.hpp
 * @brief Registry owning the available ICodec instances.
 */

#ifndef SQSH_CODEC_REGISTRY_HPP
#define SQSH_CODEC_REGISTRY_HPP

#include "codec.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sqsh {

/**
 * @brief Owns all codec adapters and provides lookups by format, MIME type
 * and extension.
 *
 * Typically instantiated once and shared (read-only) by concurrent
 * pipeline invocations.
 */
class CodecRegistry {
public:
    /**
     * @brief Construct and register the built-in codecs (PNG, JPEG, WebP).
     */
    CodecRegistry();

    [[nodiscard]] ICodec* find_by_format(ImageFormat format) const;

    /**
     * @brief Find the codec handling a MIME type (e.g. "image/png").
     * @return Non-owning pointer, or nullptr if none matches.
     */
    [[nodiscard]] ICodec* find_by_mime(const std::string& mime) const;

    /**
     * @brief Find the codec handling an extension. Comparison is case-insensitive.
     * @param ext Extension including the dot (e.g. ".png").
     * @return Non-owning pointer, or nullptr if none matches.
     */
    [[nodiscard]] ICodec* find_by_extension(const std::string& ext) const;

    [[nodiscard]] const std::vector<std::unique_ptr<ICodec>>& all() const { return codecs_; }

private:
    std::vector<std::unique_ptr<ICodec>> codecs_;
};

} // namespace sqsh

#endif // SQSH_CODEC_REGISTRY_HPP
