#pragma once

#include "mqttd/server/broker/client_info.h"
#include <string>
#include <vector>

namespace mqttd {
namespace server {
namespace protocols {
namespace http {

/**
 * @brief One row of the /connections table
 */
struct ConnectionRow {
    std::string username;
    std::string clientId;
    std::string remote;
    int protocolVersion = 0;
    std::string listener;
    size_t subscriptionCount = 0;
    std::string subscriptions; // sorted filters, newline-joined
};

struct ConnectionTable {
    std::vector<ConnectionRow> rows;     // sorted by (username, clientId)
    std::string listenerCounts;          // "mqtt: 2; ws: 1"
    size_t total = 0;
};

/**
 * @brief Header values of the /connections page
 */
struct StatusPageContext {
    std::string currentTime;
    std::string uptime;
    std::string listeners;
};

/**
 * @brief Builds the connection table, leaving out the broker's own
 *        in-process client (listener "local" or id "inline")
 */
ConnectionTable buildConnectionTable(const std::vector<broker::ClientSnapshot>& clients);

/**
 * @brief HTML page for /connections; refreshes itself every 180 s
 */
std::string renderConnectionsPage(const ConnectionTable& table, const StatusPageContext& context);

/**
 * @brief Tab-indented JSON for /information
 */
std::string renderInformation(const broker::SystemInfo& info);

/**
 * @brief One two-space-indented JSON document per client, each followed
 *        by a newline
 */
std::string renderClientsRawData(const std::vector<broker::ClientSnapshot>& clients);

} // namespace http
} // namespace protocols
} // namespace server
} // namespace mqttd
