#include "mqttd/server/infrastructure/address.h"
#include "mqttd/core/errors.h"
#include "mqttd/core/utils.h"

namespace mqttd {
namespace server {
namespace infrastructure {

namespace {
const char* ANY_HOST = "0.0.0.0";

bool parsePort(const std::string& text, uint16_t& port) {
    if (text.empty() || text.size() > 5 || !core::string_utils::isDigits(text)) {
        return false;
    }
    unsigned long value = std::stoul(text);
    if (value > 65535) {
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}
} // namespace

std::optional<Endpoint> parseAddress(const std::string& address) {
    std::string text = core::string_utils::trim(address);
    if (text.empty()) {
        return std::nullopt;
    }

    Endpoint endpoint;
    std::string portText;

    if (text.front() == '[') {
        auto close = text.find(']');
        if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':') {
            return std::nullopt;
        }
        endpoint.host = text.substr(1, close - 1);
        portText = text.substr(close + 2);
    } else {
        auto colon = text.rfind(':');
        if (colon == std::string::npos) {
            endpoint.host = ANY_HOST;
            portText = text;
        } else {
            if (text.find(':') != colon) {
                return std::nullopt; // bare IPv6 needs brackets
            }
            endpoint.host = text.substr(0, colon);
            portText = text.substr(colon + 1);
        }
    }

    if (endpoint.host.empty()) {
        endpoint.host = ANY_HOST;
    }
    if (!parsePort(portText, endpoint.port)) {
        return std::nullopt;
    }
    return endpoint;
}

std::string normalizeAddress(const std::string& value) {
    if (core::string_utils::trim(value).empty()) {
        return "";
    }

    auto endpoint = parseAddress(value);
    if (!endpoint) {
        throw core::ConfigError("malformed listener address: '" + value + "'");
    }
    if (endpoint->port == 0) {
        throw core::ConfigError("listener port out of range (1-65535): '" + value + "'");
    }

    if (endpoint->host.find(':') != std::string::npos) {
        return "[" + endpoint->host + "]:" + std::to_string(endpoint->port);
    }
    return endpoint->host + ":" + std::to_string(endpoint->port);
}

} // namespace infrastructure
} // namespace server
} // namespace mqttd
