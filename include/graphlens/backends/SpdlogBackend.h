#pragma once

#include "graphlens/common/ILoggerBackend.h"
#include <filesystem>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>

namespace graphlens {

/**
 * @brief spdlog-based logger backend
 *
 * Colour console sink, plus a truncating file sink when a log file is
 * given. The initial level honours LOG_LEVEL, then SPDLOG_LEVEL.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(const std::optional<std::filesystem::path>& logFile = std::nullopt);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    static spdlog::level::level_enum convertLevel(LogLevel level);
    static std::optional<spdlog::level::level_enum> levelFromEnvironment();
};

}  // namespace graphlens
