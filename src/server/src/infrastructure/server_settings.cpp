#include "mqttd/server/infrastructure/server_settings.h"
#include "mqttd/core/errors.h"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>

namespace mqttd {
namespace server {
namespace infrastructure {

namespace fs = std::filesystem;

namespace {
template <typename T>
void readKey(const nlohmann::json& json, const char* key, T& target) {
    if (!json.contains(key)) {
        return;
    }
    try {
        target = json.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw core::ConfigError(std::string("invalid value for '") + key + "': " + e.what());
    }
}
} // namespace

nlohmann::json ServerSettings::toJson() const {
    return nlohmann::json{
        {"port_tls", portTls},
        {"port_mqtt", portMqtt},
        {"port_web", portWeb},
        {"port_ws", portWs},
        {"tls_cert_file", tlsCertFile},
        {"tls_key_file", tlsKeyFile},
        {"tls_ca_file", tlsCaFile},
        {"message_timeout", messageTimeout},
        {"buffer_size", bufferSize},
        {"log_level", logLevel}
    };
}

ServerSettings ServerSettings::fromJson(const nlohmann::json& json) {
    ServerSettings settings;
    if (!json.is_object()) {
        throw core::ConfigError("configuration root must be an object");
    }

    readKey(json, "port_tls", settings.portTls);
    readKey(json, "port_mqtt", settings.portMqtt);
    readKey(json, "port_web", settings.portWeb);
    readKey(json, "port_ws", settings.portWs);
    readKey(json, "tls_cert_file", settings.tlsCertFile);
    readKey(json, "tls_key_file", settings.tlsKeyFile);
    readKey(json, "tls_ca_file", settings.tlsCaFile);
    readKey(json, "message_timeout", settings.messageTimeout);
    readKey(json, "buffer_size", settings.bufferSize);
    readKey(json, "log_level", settings.logLevel);
    return settings;
}

ServerSettings ServerSettings::loadFromFile(const std::string& path, bool writeBack) {
    ServerSettings settings;

    if (fs::exists(path)) {
        try {
            std::ifstream file(path);
            nlohmann::json config;
            file >> config;
            settings = fromJson(config);
            spdlog::info("Loaded configuration from {}", path);
        } catch (const std::exception& e) {
            spdlog::error("Failed to load configuration {}: {}, using defaults", path, e.what());
            settings = ServerSettings{};
        }
    } else {
        spdlog::info("Configuration file {} not found, using defaults", path);
    }

    if (writeBack) {
        settings.saveToFile(path);
    }
    return settings;
}

bool ServerSettings::saveToFile(const std::string& path) const {
    try {
        fs::path filePath(path);
        if (filePath.has_parent_path()) {
            fs::create_directories(filePath.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            spdlog::error("Cannot write configuration file: {}", path);
            return false;
        }
        file << toJson().dump(4);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save configuration {}: {}", path, e.what());
        return false;
    }
}

} // namespace infrastructure
} // namespace server
} // namespace mqttd
