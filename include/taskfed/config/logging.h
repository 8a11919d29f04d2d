#pragma once

#include <taskfed/core/types.h>

#include <spdlog/common.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace taskfed::config {

struct LoggingOptions {
    std::string level = "info";                 // trace/debug/info/warn/error
    std::optional<std::filesystem::path> file; // console when unset
    std::string loggerName = "taskfed";
};

// Maps trace/debug/info/warn/error (and "off") to spdlog levels
std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view level);

/**
 * @brief Install the default spdlog logger.
 *
 * With a log file the logger writes to a rotating file sink (10MB x 5 files),
 * otherwise to a colour stderr sink. TASKFED_LOG_LEVEL overrides the
 * configured level. Falls back to the existing default logger if the sink
 * cannot be created.
 */
Result<void> configureLogging(const LoggingOptions& options);

} // namespace taskfed::config
