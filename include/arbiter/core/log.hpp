#pragma once
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace arbiter::core {

    inline constexpr const char *kLoggerName = "arbiter";
    inline constexpr const char *kLogLevelEnv = "ARBITER_LOG_LEVEL";

    // Shared "arbiter" logger writing to stderr. Reuses a logger of that name if the host registered one.
    std::shared_ptr<spdlog::logger> logger();

    void setLogLevel(spdlog::level::level_enum level);
    spdlog::level::level_enum logLevel();

    // Reads ARBITER_LOG_LEVEL. Returns false if unset or not a spdlog level name.
    bool loadLogLevelFromEnv();

    // Parses a spdlog level name ("trace", "debug", "info", "warn", "error", "critical", "off").
    bool parseLogLevel(const std::string &name, spdlog::level::level_enum &level);

} // namespace arbiter::core

#define ARBITER_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::arbiter::core::logger(), __VA_ARGS__)
#define ARBITER_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::arbiter::core::logger(), __VA_ARGS__)
#define ARBITER_LOG_WARN(...) SPDLOG_LOGGER_WARN(::arbiter::core::logger(), __VA_ARGS__)
