#pragma once

#include "mqttd/server/broker/listener.h"
#include "mqttd/server/protocols/tcp/acceptor.h"
#include <atomic>

namespace mqttd {
namespace server {
namespace protocols {
namespace websocket {

/**
 * @brief MQTT over WebSocket (wss when the config carries TLS material)
 */
class WebSocketListener : public broker::IListener {
public:
    explicit WebSocketListener(broker::ListenerConfig config);
    ~WebSocketListener() override;

    std::string id() const override { return config_.id; }
    std::string address() const override { return config_.address; }
    std::string protocol() const override { return config_.tls ? "wss" : "ws"; }

    void init(std::shared_ptr<spdlog::logger> logger) override;
    void serve(broker::EstablishFn establish) override;
    void close(broker::CloseFn closeClients) override;

    broker::ListenerState state() const { return state_; }
    uint16_t boundPort() const { return acceptor_.port(); }

private:
    broker::ListenerConfig config_;
    tcp::Acceptor acceptor_;
    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<broker::ListenerState> state_{broker::ListenerState::CREATED};
    std::atomic<bool> end_{false};
};

} // namespace websocket
} // namespace protocols
} // namespace server
} // namespace mqttd
