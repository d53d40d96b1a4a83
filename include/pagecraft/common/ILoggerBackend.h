#pragma once

#include <source_location>
#include <string>

namespace pagecraft {

/// Severity of a diagnostic line, lowest first. Off silences everything.
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
 * @brief Destination for pagecraft diagnostics
 *
 * An editor that already has a console or telemetry channel implements this
 * and hands it to Logger::setBackend(). Messages arrive fully formatted and
 * carry the call site of the LOG_* macro that produced them.
 *
 * @code
 * class EditorConsoleBackend : public pagecraft::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location& loc) override {
 *         console->append(level, message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { console->setMinLevel(level); }
 *     void flush() override {}
 * };
 *
 * pagecraft::Logger::setBackend(std::make_unique<EditorConsoleBackend>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /// Emit one line. Implementations decide whether `level` passes their filter.
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    /// Called by Logger::flush()
    virtual void flush() = 0;
};

}  // namespace pagecraft
