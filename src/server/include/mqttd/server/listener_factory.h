#pragma once

#include "mqttd/server/broker/broker.h"
#include "mqttd/server/broker/listener.h"
#include "mqttd/server/protocols/http/control_plane_listener.h"
#include <memory>

namespace mqttd {
namespace server {

/**
 * @brief Creates the listeners the server registers with the broker
 */
class IListenerFactory {
public:
    virtual ~IListenerFactory() = default;

    virtual std::shared_ptr<broker::IListener> createTcp(const broker::ListenerConfig& config) = 0;
    virtual std::shared_ptr<broker::IListener> createWebSocket(const broker::ListenerConfig& config) = 0;
    virtual std::shared_ptr<broker::IListener> createControlPlane(protocols::http::ControlPlaneOptions options,
                                                                  const broker::IBrokerState* state) = 0;
};

/**
 * @brief Asio TCP/WebSocket listeners and the Crow control plane
 */
class DefaultListenerFactory : public IListenerFactory {
public:
    std::shared_ptr<broker::IListener> createTcp(const broker::ListenerConfig& config) override;
    std::shared_ptr<broker::IListener> createWebSocket(const broker::ListenerConfig& config) override;
    std::shared_ptr<broker::IListener> createControlPlane(protocols::http::ControlPlaneOptions options,
                                                          const broker::IBrokerState* state) override;
};

} // namespace server
} // namespace mqttd
