#include "mqttd/server/broker/client_info.h"
#include "mqttd/core/utils.h"

namespace mqttd {
namespace server {
namespace broker {

void to_json(nlohmann::json& j, const ClientSnapshot& client) {
    nlohmann::json subscriptions = nlohmann::json::object();
    for (const auto& sub : client.subscriptions) {
        subscriptions[sub.first] = {{"filter", sub.first}, {"qos", sub.second}};
    }

    j = nlohmann::json{
        {"id", client.id},
        {"username", client.username},
        {"remote", client.remote},
        {"listener", client.listener},
        {"protocol_version", client.protocolVersion},
        {"inline", client.inlineClient},
        {"clean", client.cleanStart},
        {"keepalive", client.keepalive},
        {"connected_at", core::formatTime(client.connectedAt)},
        {"subscriptions", subscriptions}
    };
}

void to_json(nlohmann::json& j, const SystemInfo& info) {
    j = nlohmann::json{
        {"version", info.version},
        {"started", info.started},
        {"time", info.time},
        {"uptime", info.uptime},
        {"bytes_received", info.bytesReceived},
        {"bytes_sent", info.bytesSent},
        {"clients_connected", info.clientsConnected},
        {"clients_disconnected", info.clientsDisconnected},
        {"clients_maximum", info.clientsMaximum},
        {"clients_total", info.clientsTotal},
        {"messages_received", info.messagesReceived},
        {"messages_sent", info.messagesSent},
        {"messages_dropped", info.messagesDropped},
        {"retained", info.retained},
        {"inflight", info.inflight},
        {"subscriptions", info.subscriptions},
        {"packets_received", info.packetsReceived},
        {"packets_sent", info.packetsSent},
        {"memory_resident", info.memoryResident},
        {"threads", info.threads}
    };
}

} // namespace broker
} // namespace server
} // namespace mqttd
