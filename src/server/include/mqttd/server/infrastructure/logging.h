#pragma once

#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace mqttd {
namespace server {
namespace infrastructure {

/**
 * @brief Maps trace/debug/info/warn/error/critical/off to a spdlog level
 *
 * Unknown names map to info.
 */
spdlog::level::level_enum parseLogLevel(const std::string& level);

/**
 * @brief Creates the "mqttd" logger and makes it the default
 *
 * Logs to colored stdout and, when @p logFile is given, to a daily
 * rotating file keeping 30 files.
 */
std::shared_ptr<spdlog::logger> setupLogging(const std::string& level, const std::string& logFile);

} // namespace infrastructure
} // namespace server
} // namespace mqttd
