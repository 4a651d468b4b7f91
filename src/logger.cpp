#include "logger.hpp"

#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace reservation {

void Logger::init(spdlog::level::level_enum level, const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(level);
    sinks.push_back(console_sink);

    if (!log_file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, kMaxFileBytes, kMaxFiles);
        file_sink->set_level(level);
        sinks.push_back(file_sink);
    }

    // re-init replaces the previous logger under the same name
    if (logger_) spdlog::drop(logger_->name());

    logger_ = std::make_shared<spdlog::logger>("reservation", sinks.begin(), sinks.end());
    logger_->set_pattern(kLogFormat);
    logger_->set_level(level);
    logger_->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger_);
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (logger_) return logger_;
    return spdlog::default_logger();
}

} // namespace reservation
