#pragma once

#include "pagecraft/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace pagecraft {

/**
 * @brief Process-wide sink for pagecraft diagnostics
 *
 * Every LOG_* line goes to one ILoggerBackend. Until the editor installs its
 * own, an spdlog console backend is created on the first write. Independently
 * of the backend, the last lines can be mirrored into a ring so an inspector
 * pane or a test can read back why a drop was refused.
 *
 * Example:
 * @code
 * pagecraft::Logger::initialize();
 * pagecraft::Logger::enableCapture(true);
 * LOG_INFO("Moved {} under {}", componentId, parentId);
 * auto logs = pagecraft::Logger::getCapturedLogs("Moved");
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Replace the active backend
     * @param backend Editor-supplied sink, owned by the Logger from now on
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Install the spdlog console backend unless one is already set
     */
    static void initialize();

    /**
     * @brief Same as initialize(), optionally also writing a session file
     * @param logDir Where the session file goes
     * @param logToFile false keeps console output only
     */
    static void initialize(const std::string& logDir, bool logToFile = true);

    /// Lines below this level are dropped by the backend
    static void setLevel(LogLevel level);

    // Prefer the LOG_* macros, which format and record the call site
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

    // ===== Captured lines =====

    /**
     * @brief Start or stop mirroring lines into the capture ring
     *
     * The ring holds setCaptureCapacity() lines; the oldest line is evicted
     * first.
     */
    static void enableCapture(bool enable);

    static bool isCaptureEnabled();

    /**
     * @brief Change how many lines the ring keeps (1000 by default).
     * Lines already captured are discarded.
     */
    static void setCaptureCapacity(size_t maxLines);

    /**
     * @brief Read back captured lines
     * @param pattern Keep only lines containing this text; empty keeps all
     * @param maxLines Return at most the newest maxLines matches; 0 means no cap
     * @return Lines in the order they were written
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void write(LogLevel level, const char* tag, const std::string& message,
                      const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(const std::string& message);
};

}  // namespace pagecraft

// Logging macros with std::format support
#define LOG_TRACE(...) pagecraft::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) pagecraft::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  pagecraft::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  pagecraft::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) pagecraft::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
