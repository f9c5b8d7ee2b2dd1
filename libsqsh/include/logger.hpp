/**
 * @file logger.hpp
 * @brief Process-wide logging entry point.
 */

#ifndef SQSH_LOGGER_HPP
#define SQSH_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sqsh {

/**
 * @brief Forwards each message to every installed sink.
 *
 * Components pass a short tag naming themselves ("pipeline",
 * "staged_write", ...). Without sinks nothing is printed.
 */
class Logger {
public:
    /// Takes ownership; null sinks are ignored.
    static void add_sink(std::unique_ptr<ILogSink> sink);

    static void clear_sinks();

    static void log(LogLevel level, std::string_view msg, std::string_view tag = "sqsh");

    static const char* level_to_string(LogLevel level);

    /**
     * @brief Level for a --log-level value, case-insensitive.
     * @return std::nullopt for "NONE" and unknown names (log nothing).
     */
    static std::optional<LogLevel> string_to_level(std::string level);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

} // namespace sqsh

#endif // SQSH_LOGGER_HPP
