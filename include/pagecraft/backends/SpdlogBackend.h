#pragma once

#include "pagecraft/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace pagecraft {

/**
 * @brief spdlog-based logger backend
 *
 * Console sink always, plus an optional file sink (pagecraft.log) when a log
 * directory is given. The LOG_LEVEL (or SPDLOG_LEVEL) environment variable
 * overrides the default info level.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    static spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace pagecraft
