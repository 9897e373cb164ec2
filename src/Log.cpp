#include "Log.h"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace scanorch {

std::shared_ptr<spdlog::logger> makeLogger(const std::string& name) {
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto logger = spdlog::stderr_color_mt(name);
    logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->set_level(spdlog::level::info);
    return logger;
}

std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name) {
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    return spdlog::null_logger_mt(name);
}

void setLogLevel(spdlog::logger& logger, const std::string& level_name) {
    const auto level = spdlog::level::from_str(level_name);
    // from_str maps unknown names to "off"; only honor "off" when asked for explicitly.
    if (level == spdlog::level::off && level_name != "off") {
        logger.warn("unknown log level '{}', keeping current", level_name);
        return;
    }
    logger.set_level(level);
}

} // namespace scanorch
