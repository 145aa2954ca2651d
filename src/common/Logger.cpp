#include "graphlens/common/Logger.h"
#include "graphlens/backends/SpdlogBackend.h"

#include <mutex>
#include <string_view>

namespace graphlens {

std::unique_ptr<ILoggerBackend> Logger::backend_;

namespace {
std::mutex backendMutex;

std::mutex captureMutex;
bool captureEnabled = false;
std::vector<std::string> captured;

constexpr std::string_view NAMESPACE_PREFIX = "graphlens::";

// "void graphlens::GraphView::setSelected(std::optional<unsigned int>)" -> "GraphView::setSelected"
std::string callerName(const std::source_location& loc) {
    const std::string_view signature = loc.function_name();
    const size_t paren = signature.find('(');
    if (paren == std::string_view::npos) {
        return "unknown";
    }

    // Walk back from the parameter list; the name starts after the last
    // space that is not inside a template argument list
    size_t start = 0;
    int depth = 0;
    for (size_t i = paren; i-- > 0;) {
        const char c = signature[i];
        if (c == '>') {
            ++depth;
        } else if (c == '<') {
            --depth;
        } else if (depth == 0 && (c == ' ' || c == '*' || c == '&')) {
            start = i + 1;
            break;
        }
    }

    std::string name;
    depth = 0;
    for (char c : signature.substr(start, paren - start)) {
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            --depth;
        } else if (depth == 0) {
            name += c;
        }
    }

    if (std::string_view(name).starts_with(NAMESPACE_PREFIX)) {
        name.erase(0, NAMESPACE_PREFIX.size());
    }
    return name.empty() ? "unknown" : name;
}
}  // namespace

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backendMutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>();
    }
}

void Logger::initialize(const std::filesystem::path& logFile) {
    std::lock_guard<std::mutex> lock(backendMutex);
    backend_ = std::make_unique<SpdlogBackend>(logFile);
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::trace(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Trace, "trace", message, loc);
}

void Logger::debug(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Debug, "debug", message, loc);
}

void Logger::info(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Info, "info", message, loc);
}

void Logger::warn(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Warn, "warn", message, loc);
}

void Logger::error(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Error, "error", message, loc);
}

void Logger::flush() {
    ensureBackend();
    backend_->flush();
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

void Logger::write(LogLevel level, const char* tag, const std::string& message,
                   const std::source_location& loc) {
    ensureBackend();
    const std::string line = callerName(loc) + "() - " + message;
    backend_->log(level, line, loc);

    std::lock_guard<std::mutex> lock(captureMutex);
    if (captureEnabled) {
        captured.push_back(std::string("[") + tag + "] " + line);
    }
}

void Logger::enableCapture(bool enable) {
    std::lock_guard<std::mutex> lock(captureMutex);
    captureEnabled = enable;
}

std::vector<std::string> Logger::capturedLogs() {
    std::lock_guard<std::mutex> lock(captureMutex);
    return captured;
}

void Logger::clearCapturedLogs() {
    std::lock_guard<std::mutex> lock(captureMutex);
    captured.clear();
}

}  // namespace graphlens
