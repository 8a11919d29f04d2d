#include <taskfed/config/config_helpers.h>
#include <taskfed/config/logging.h>
#include <taskfed/core/format.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace taskfed::config {

std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view level) {
    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "info")
        return spdlog::level::info;
    if (level == "warn" || level == "warning")
        return spdlog::level::warn;
    if (level == "error")
        return spdlog::level::err;
    if (level == "off")
        return spdlog::level::off;
    return std::nullopt;
}

Result<void> configureLogging(const LoggingOptions& options) {
    std::string levelName = get_env_or("TASKFED_LOG_LEVEL", options.level);
    auto level = parseLogLevel(levelName);
    if (!level) {
        return Error{ErrorCode::InvalidArgument, format("Unknown log level '{}'", levelName)};
    }

    try {
        std::shared_ptr<spdlog::logger> logger;
        if (options.file) {
            std::error_code ec;
            if (options.file->has_parent_path()) {
                std::filesystem::create_directories(options.file->parent_path(), ec);
            }
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 5;
            auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.file->string(), max_size, max_files);
            logger = std::make_shared<spdlog::logger>(options.loggerName, sink);
            spdlog::flush_on(spdlog::level::info);
        } else {
            auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            logger = std::make_shared<spdlog::logger>(options.loggerName, sink);
        }
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::warn("[Logging] Could not create log sink, keeping default logger: {}", e.what());
    }

    spdlog::set_level(*level);
    return {};
}

} // namespace taskfed::config
