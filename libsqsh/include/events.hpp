#ifndef SQSH_EVENTS_HPP
#define SQSH_EVENTS_HPP

#include "errors.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace sqsh {

/**
 * @brief Events published by BatchExecutor, one Start and exactly one of
 * Complete/Skipped/Error per file (Skipped alone for files never started).
 */

struct TransformStartEvent {
    std::filesystem::path path;
};

struct TransformCompleteEvent {
    std::filesystem::path path;            ///< Source file
    std::filesystem::path output_path;     ///< Where the result lives
    std::uintmax_t original_size = 0;
    std::uintmax_t new_size = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief No improvement, or the batch was stopped before the file started.
 */
struct TransformSkippedEvent {
    std::filesystem::path path;
    std::string reason;
};

struct TransformErrorEvent {
    std::filesystem::path path;
    ErrorKind kind = ErrorKind::IOFailure;
    std::string error_message;
};

} // namespace sqsh

#endif // SQSH_EVENTS_HPP
