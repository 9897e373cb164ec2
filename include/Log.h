#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace scanorch {

// Default logger name shared by the session and its controllers.
inline constexpr const char* kLoggerName = "scanorch";

// Returns the registered logger with this name, creating a colored stderr
// logger on first use. Never returns null.
std::shared_ptr<spdlog::logger> makeLogger(const std::string& name = kLoggerName);

// Logger that drops everything (tests that assert on events, not on logs).
std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name = "scanorch-null");

// Accepts "trace|debug|info|warn|error|critical|off"; unknown names keep the current level.
void setLogLevel(spdlog::logger& logger, const std::string& level_name);

} // namespace scanorch
