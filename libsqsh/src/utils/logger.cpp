#include "../../include/logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace sqsh {

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;

namespace {

constexpr std::array<std::pair<const char*, LogLevel>, 5> kLevelNames = {{
    {"DEBUG", LogLevel::Debug},
    {"INFO", LogLevel::Info},
    {"WARNING", LogLevel::Warning},
    {"WARN", LogLevel::Warning},
    {"ERROR", LogLevel::Error},
}};

} // namespace

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard lock(mtx_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::log(const LogLevel level, const std::string_view msg, const std::string_view tag) {
    std::lock_guard lock(mtx_);
    for (const auto& sink : sinks_) sink->log(level, msg, tag);
}

const char* Logger::level_to_string(const LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
    }
    return "?";
}

std::optional<LogLevel> Logger::string_to_level(std::string level) {
    for (auto& c : level) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    const auto it = std::ranges::find_if(kLevelNames, [&level](const auto& entry) {
        return level == entry.first;
    });
    if (it == kLevelNames.end()) return std::nullopt;
    return it->second;
}

} // namespace sqsh
