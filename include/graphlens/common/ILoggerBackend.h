#pragma once

#include <source_location>
#include <string>

namespace graphlens {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/**
 * @brief Sink for GraphLens diagnostics
 *
 * Hosts that embed a GraphView next to their own logging install an
 * implementation with Logger::setBackend(); SpdlogBackend is used otherwise.
 * Messages arrive already formatted and prefixed with the caller.
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;
    virtual void setLevel(LogLevel level) = 0;
    virtual void flush() = 0;
};

}  // namespace graphlens
