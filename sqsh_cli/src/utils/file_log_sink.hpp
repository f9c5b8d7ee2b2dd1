#ifndef SQSH_FILE_LOG_SINK_HPP
#define SQSH_FILE_LOG_SINK_HPP

#include "../../../libsqsh/include/log_sink.hpp"
#include "../../../libsqsh/include/logger.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>

class FileLogSink final : public sqsh::ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const sqsh::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open()) return;

        std::lock_guard lock(mtx_);
        out_ << "[" << sqsh::Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // SQSH_FILE_LOG_SINK_HPP
