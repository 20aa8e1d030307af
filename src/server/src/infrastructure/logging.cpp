#include "mqttd/server/infrastructure/logging.h"
#include "mqttd/core/utils.h"
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <iostream>
#include <vector>

namespace mqttd {
namespace server {
namespace infrastructure {

namespace fs = std::filesystem;

spdlog::level::level_enum parseLogLevel(const std::string& level) {
    std::string name = core::string_utils::toLower(level);
    if (name == "trace") {
        return spdlog::level::trace;
    } else if (name == "debug") {
        return spdlog::level::debug;
    } else if (name == "info") {
        return spdlog::level::info;
    } else if (name == "warn" || name == "warning") {
        return spdlog::level::warn;
    } else if (name == "error") {
        return spdlog::level::err;
    } else if (name == "critical") {
        return spdlog::level::critical;
    } else if (name == "off") {
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> setupLogging(const std::string& level, const std::string& logFile) {
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    std::vector<spdlog::sink_ptr> sinks{consoleSink};

    if (!logFile.empty()) {
        try {
            fs::path filePath(logFile);
            if (filePath.has_parent_path()) {
                fs::create_directories(filePath.parent_path());
            }
            auto fileSink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(logFile, 0, 0, false, 30);
            sinks.push_back(fileSink);
        } catch (const std::exception& e) {
            std::cerr << "Cannot open log file " << logFile << ": " << e.what() << std::endl;
        }
    }

    auto logger = std::make_shared<spdlog::logger>("mqttd", sinks.begin(), sinks.end());
    logger->set_level(parseLogLevel(level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    if (sinks.size() > 1) {
        spdlog::info("Logging to {}", logFile);
    }
    return logger;
}

} // namespace infrastructure
} // namespace server
} // namespace mqttd
