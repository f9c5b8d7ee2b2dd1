#ifndef SQSH_CONSOLE_LOG_SINK_HPP
#define SQSH_CONSOLE_LOG_SINK_HPP

#include "../../../libsqsh/include/log_sink.hpp"
#include <iostream>
#include <mutex>
#include <optional>

/**
 * @brief Prints messages at or above a threshold; warnings and errors go to stderr.
 * An empty threshold prints nothing.
 */
class ConsoleLogSink final : public sqsh::ILogSink {
public:
    std::optional<sqsh::LogLevel> log_level = sqsh::LogLevel::Error;

    void log(const sqsh::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!log_level || level < *log_level) return;

        std::lock_guard lock(mtx_);
        switch (level) {
            case sqsh::LogLevel::Debug:
                std::cout << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case sqsh::LogLevel::Info:
                std::cout << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case sqsh::LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case sqsh::LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }

private:
    std::mutex mtx_;
};

#endif // SQSH_CONSOLE_LOG_SINK_HPP
