#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace mqttd {
namespace server {
namespace infrastructure {

/**
 * @brief Contents of the JSON configuration file
 *
 * Addresses accept a bare port ("1883"), ":port" or "host:port"; an empty
 * value disables that listener.
 */
struct ServerSettings {
    std::string portTls = "1881";
    std::string portMqtt = "1883";
    std::string portWeb = "1880";
    std::string portWs;
    std::string tlsCertFile = "cert.ec.pem";
    std::string tlsKeyFile = "cert-key.ec.pem";
    std::string tlsCaFile;
    int messageTimeout = 3600;
    int bufferSize = 8192;
    std::string logLevel = "info";

    nlohmann::json toJson() const;

    /**
     * @brief Overlays the keys present in @p json onto the defaults
     *
     * @throws ConfigError when a key has the wrong type
     */
    static ServerSettings fromJson(const nlohmann::json& json);

    /**
     * @brief Loads @p path, falling back to defaults when it is missing or
     *        malformed, and writes the effective settings back
     */
    static ServerSettings loadFromFile(const std::string& path, bool writeBack = true);

    bool saveToFile(const std::string& path) const;
};

} // namespace infrastructure
} // namespace server
} // namespace mqttd
