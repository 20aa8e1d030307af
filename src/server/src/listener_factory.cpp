#include "mqttd/server/listener_factory.h"
#include "mqttd/server/protocols/tcp/tcp_listener.h"
#include "mqttd/server/protocols/websocket/websocket_listener.h"

namespace mqttd {
namespace server {

std::shared_ptr<broker::IListener> DefaultListenerFactory::createTcp(const broker::ListenerConfig& config) {
    return std::make_shared<protocols::tcp::TcpListener>(config);
}

std::shared_ptr<broker::IListener> DefaultListenerFactory::createWebSocket(const broker::ListenerConfig& config) {
    return std::make_shared<protocols::websocket::WebSocketListener>(config);
}

std::shared_ptr<broker::IListener> DefaultListenerFactory::createControlPlane(
    protocols::http::ControlPlaneOptions options, const broker::IBrokerState* state) {
    return std::make_shared<protocols::http::ControlPlaneListener>(std::move(options), state);
}

} // namespace server
} // namespace mqttd
