#include "graphlens/backends/SpdlogBackend.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace graphlens {

namespace {
constexpr const char* LOGGER_NAME = "graphlens";
constexpr const char* CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
}  // namespace

SpdlogBackend::SpdlogBackend(const std::optional<std::filesystem::path>& logFile) {
    // A previous backend may still own the registered name
    spdlog::drop(LOGGER_NAME);

    std::vector<spdlog::sink_ptr> sinks;
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(consoleSink);

    if (logFile && !logFile->empty()) {
        if (logFile->has_parent_path()) {
            std::filesystem::create_directories(logFile->parent_path());
        }
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile->string(), true);
        fileSink->set_pattern(FILE_PATTERN);
        sinks.push_back(fileSink);
    }

    logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    spdlog::register_logger(logger_);

    logger_->set_level(levelFromEnvironment().value_or(spdlog::level::info));
}

void SpdlogBackend::log(LogLevel level, const std::string& message,
                        [[maybe_unused]] const std::source_location& loc) {
    if (logger_) {
        logger_->log(convertLevel(level), message);
    }
}

void SpdlogBackend::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(convertLevel(level));
    }
}

void SpdlogBackend::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

std::optional<spdlog::level::level_enum> SpdlogBackend::levelFromEnvironment() {
    const char* envLevel = std::getenv("LOG_LEVEL");
    if (!envLevel) {
        envLevel = std::getenv("SPDLOG_LEVEL");
    }
    if (!envLevel) {
        return std::nullopt;
    }

    std::string levelStr(envLevel);
    std::transform(levelStr.begin(), levelStr.end(), levelStr.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (levelStr == "trace") return spdlog::level::trace;
    if (levelStr == "debug") return spdlog::level::debug;
    if (levelStr == "info") return spdlog::level::info;
    if (levelStr == "warn" || levelStr == "warning") return spdlog::level::warn;
    if (levelStr == "err" || levelStr == "error") return spdlog::level::err;
    if (levelStr == "critical") return spdlog::level::critical;
    if (levelStr == "off") return spdlog::level::off;
    return std::nullopt;
}

}  // namespace graphlens
