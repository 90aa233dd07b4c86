#include "arbiter/core/log.hpp"
#include <cstdlib>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace arbiter::core {

    std::shared_ptr<spdlog::logger> logger() {
        static std::shared_ptr<spdlog::logger> instance = [] {
            if (auto existing = spdlog::get(kLoggerName))
                return existing;
            auto created = spdlog::stderr_color_mt(kLoggerName);
            created->set_level(spdlog::level::warn);
            created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            return created;
        }();
        return instance;
    }

    void setLogLevel(spdlog::level::level_enum level) { logger()->set_level(level); }

    spdlog::level::level_enum logLevel() { return logger()->level(); }

    bool parseLogLevel(const std::string &name, spdlog::level::level_enum &level) {
        auto parsed = spdlog::level::from_str(name);
        // from_str maps anything unrecognised to off, so only accept "off" when asked for literally.
        if (parsed == spdlog::level::off && name != "off")
            return false;
        level = parsed;
        return true;
    }

    bool loadLogLevelFromEnv() {
        const char *value = std::getenv(kLogLevelEnv);
        if (!value)
            return false;

        spdlog::level::level_enum level;
        if (!parseLogLevel(value, level)) {
            ARBITER_LOG_WARN("ignoring {}='{}': not a log level", kLogLevelEnv, value);
            return false;
        }
        setLogLevel(level);
        return true;
    }

} // namespace arbiter::core
