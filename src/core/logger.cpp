#include "televault/core/logger.hpp"
#include "televault/core/utils.hpp"
#include <spdlog/pattern_formatter.h>
#include <vector>

namespace televault::core {

std::shared_ptr<spdlog::logger> Logger::logger_;

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    auto lower = utils::StringUtils::to_lower(utils::StringUtils::trim(name));
    if (lower == "warning") return LogLevel::Warn;
    if (lower.empty()) return fallback;

    // spdlog maps unknown names to "off", so only trust that answer for "off".
    auto level = spdlog::level::from_str(lower);
    if (level == spdlog::level::off && lower != "off") {
        return fallback;
    }
    return static_cast<LogLevel>(level);
}

void Logger::initialize(const std::string& log_file, LogLevel level) {
    const auto spd_level = static_cast<spdlog::level::level_enum>(level);

    // Progress bars own stdout, so diagnostics go to stderr.
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spd_level);
    console_sink->set_pattern("%^%l%$: %v");

    std::vector<spdlog::sink_ptr> sinks{console_sink};
    std::string file_error;
    if (!log_file.empty()) {
        auto parent = std::filesystem::path(log_file).parent_path();
        if (!parent.empty()) {
            utils::FileUtils::create_directories(parent);
        }
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1048576 * 5, 3);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    logger_ = std::make_shared<spdlog::logger>("televault", sinks.begin(), sinks.end());
    logger_->set_level(spd_level);
    logger_->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger_);
    spdlog::set_level(spd_level);

    if (!file_error.empty()) {
        LOG_WARN("Logging to console only, cannot open {}: {}", log_file, file_error);
    }
    LOG_DEBUG("Logger initialized at level {}", spdlog::level::to_string_view(spd_level));
}

void Logger::shutdown() {
    if (!logger_) {
        return;
    }
    logger_->flush();

    // LOG_* macros always go through the default logger, so leave a
    // warn-level stderr logger behind instead of none.
    auto fallback = std::make_shared<spdlog::logger>(
        "televault", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    fallback->set_level(spdlog::level::warn);
    spdlog::set_default_logger(fallback);
    logger_.reset();
}

}
