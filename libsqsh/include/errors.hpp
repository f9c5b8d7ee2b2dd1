/**
 * @file errors.hpp
 * @brief Error kinds reported by sqsh operations.
 */

#ifndef SQSH_ERRORS_HPP
#define SQSH_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace sqsh {

/**
 * @brief Classification of a failed operation.
 */
enum class ErrorKind {
    NotFound,          ///< Source path missing
    UnsupportedFormat, ///< Source or target format outside the supported set
    CodecFailure,      ///< Decode/encode error reported by a codec library
    IOFailure,         ///< Create/copy/remove/read failure while staging or committing
    ConfigFailure      ///< Settings could not be read or written
};

constexpr std::string_view error_kind_name(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NotFound:          return "NotFound";
        case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorKind::CodecFailure:      return "CodecFailure";
        case ErrorKind::IOFailure:         return "IOFailure";
        case ErrorKind::ConfigFailure:     return "ConfigFailure";
    }
    return "Unknown";
}

/**
 * @brief Exception thrown by sqsh operations.
 *
 * Carries an ErrorKind next to the descriptive message so callers can
 * react to the category without parsing text.
 */
class SqshError : public std::runtime_error {
public:
    SqshError(const ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace sqsh

#endif // SQSH_ERRORS_HPP
