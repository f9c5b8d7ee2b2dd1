#ifndef SQSH_LOG_SINK_HPP
#define SQSH_LOG_SINK_HPP

#include <string_view>

namespace sqsh {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @brief Destination for log lines (console, file, the Sqsh observer).
 *
 * Called with the Logger mutex held, so implementations see one message at
 * a time and must not log themselves.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    virtual void log(LogLevel level, std::string_view message, std::string_view tag) = 0;
};

} // namespace sqsh

#endif // SQSH_LOG_SINK_HPP
