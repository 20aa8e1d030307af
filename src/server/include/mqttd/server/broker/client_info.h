#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace mqttd {
namespace server {
namespace broker {

/**
 * @brief Point-in-time copy of one connected client session
 */
struct ClientSnapshot {
    std::string id;
    std::string username;
    std::string remote;
    std::string listener;
    int protocolVersion = 4;
    bool inlineClient = false;
    bool cleanStart = true;
    uint16_t keepalive = 0;
    std::chrono::system_clock::time_point connectedAt;
    std::map<std::string, int> subscriptions; // filter -> qos
};

/**
 * @brief Broker-wide counters
 */
struct SystemInfo {
    std::string version;
    int64_t started = 0; // unix seconds
    int64_t time = 0;
    int64_t uptime = 0;
    int64_t bytesReceived = 0;
    int64_t bytesSent = 0;
    int64_t clientsConnected = 0;
    int64_t clientsDisconnected = 0;
    int64_t clientsMaximum = 0;
    int64_t clientsTotal = 0;
    int64_t messagesReceived = 0;
    int64_t messagesSent = 0;
    int64_t messagesDropped = 0;
    int64_t retained = 0;
    int64_t inflight = 0;
    int64_t subscriptions = 0;
    int64_t packetsReceived = 0;
    int64_t packetsSent = 0;
    int64_t memoryResident = 0; // bytes
    int64_t threads = 0;
};

void to_json(nlohmann::json& j, const ClientSnapshot& client);
void to_json(nlohmann::json& j, const SystemInfo& info);

} // namespace broker
} // namespace server
} // namespace mqttd
