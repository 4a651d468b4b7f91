#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace reservation {

/**
 * @brief Process-wide access to the service logger.
 *
 * @details
 * init() builds the "reservation" logger with a colour console sink and,
 * when @p log_file is non-empty, a rotating file sink (10 MiB x 5).
 * Until init() runs, get() hands out spdlog's default logger so the core
 * can be used (and tested) without any logging setup.
 *
 * init() is meant to be called once at startup, before other threads log.
 */
class Logger {
public:
    static void init(spdlog::level::level_enum level = spdlog::level::info,
                     const std::string& log_file = "");

    static std::shared_ptr<spdlog::logger> get();

    static bool is_initialized() { return logger_ != nullptr; }

private:
    static constexpr const char* kLogFormat = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
    static constexpr std::size_t kMaxFileBytes = 10 * 1024 * 1024;
    static constexpr std::size_t kMaxFiles = 5;

    inline static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace reservation
