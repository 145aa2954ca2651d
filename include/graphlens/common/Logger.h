#pragma once

#include "graphlens/common/ILoggerBackend.h"
#include <filesystem>
#include <memory>
#include <source_location>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <vector>

namespace graphlens {

/**
 * @brief Diagnostics for dataset uploads, renderer setup and view state
 *
 * GraphView, GlRenderer and the serializers report through the LOG_*
 * macros below. Each line is prefixed with the calling function, with the
 * graphlens:: qualifier stripped. Without an explicit initialize() or
 * setBackend() the console-only SpdlogBackend is created on first use.
 */
class Logger {
public:
    /// Route diagnostics into a host logger (ownership transferred)
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /// Console output only
    static void initialize();

    /// Console output plus a copy of every line in @p logFile
    static void initialize(const std::filesystem::path& logFile);

    static void setLevel(LogLevel level);

    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    static void flush();

    /// While enabled, lines are also kept in memory as "[level] caller() - message"
    static void enableCapture(bool enable);
    static std::vector<std::string> capturedLogs();
    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void write(LogLevel level, const char* tag, const std::string& message,
                      const std::source_location& loc);
};

}  // namespace graphlens

// fmt comes bundled with spdlog
#define LOG_TRACE(...) graphlens::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) graphlens::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  graphlens::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  graphlens::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) graphlens::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
