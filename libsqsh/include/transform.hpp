/**
 * @file transform.hpp
 * @brief Request and outcome records of a single-file transform.
 */

#ifndef SQSH_TRANSFORM_HPP
#define SQSH_TRANSFORM_HPP

#include "image_format.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace sqsh {

/**
 * @brief One file to optimize or convert.
 */
struct TransformRequest {
    std::filesystem::path source_path;         ///< File to transform
    bool overwrite = true;                     ///< Commit next to / over the source instead of returning the staged file
    std::optional<TargetFormat> target_format; ///< Empty or Same: optimize in the source's format
};

/**
 * @brief Result of a transform that did not fail.
 *
 * When skipped is true the source was left untouched: output_path equals
 * the source path, new_size equals original_size and saved_bytes is 0.
 */
struct TransformOutcome {
    std::uintmax_t original_size = 0;
    std::uintmax_t new_size = 0;
    std::uintmax_t saved_bytes = 0;       ///< max(0, original_size - new_size)
    std::filesystem::path output_path;
    bool skipped = false;
    std::chrono::milliseconds duration{0}; ///< Wall clock of the whole transform
};

} // namespace sqsh

#endif // SQSH_TRANSFORM_HPP
