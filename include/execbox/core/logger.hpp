#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace execbox {

/// Process-wide logger. Writes to stderr so that stdout stays reserved for
/// protocol traffic when serving over stdio.
class Logger {
public:
    static void init(std::string_view name = "execbox", std::string_view level = "info");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    /// Attach a size-rotated log file next to the stderr sink.
    static void add_rotating_file(const std::filesystem::path& path,
                                  std::size_t max_bytes, std::size_t max_files);

    static void set_level(std::string_view level);
    static void flush();
};

} // namespace execbox

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::execbox::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::execbox::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::execbox::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::execbox::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::execbox::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::execbox::Logger::get(), __VA_ARGS__)
