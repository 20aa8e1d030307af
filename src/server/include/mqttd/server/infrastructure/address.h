#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace mqttd {
namespace server {
namespace infrastructure {

struct Endpoint {
    std::string host;
    uint16_t port = 0;
};

/**
 * @brief Splits "host:port", "[v6]:port", ":port" or "port"
 *
 * A missing host becomes "0.0.0.0". Port 0 is accepted (ephemeral).
 *
 * @return std::nullopt when the text is not an address
 */
std::optional<Endpoint> parseAddress(const std::string& address);

/**
 * @brief Normalizes a configured listener address
 *
 * "1883" and ":1883" become "0.0.0.0:1883"; an empty value stays empty
 * (listener disabled).
 *
 * @throws ConfigError when the address is malformed or the port is
 *         outside 1-65535
 */
std::string normalizeAddress(const std::string& value);

} // namespace infrastructure
} // namespace server
} // namespace mqttd
