#include "mqttd/server/protocols/websocket/websocket_listener.h"
#include "mqttd/server/protocols/websocket/websocket_connection.h"
#include "mqttd/core/errors.h"
#include <spdlog/spdlog.h>

namespace mqttd {
namespace server {
namespace protocols {
namespace websocket {

WebSocketListener::WebSocketListener(broker::ListenerConfig config)
    : config_(std::move(config)), acceptor_(config_.address), logger_(spdlog::default_logger()) {
}

WebSocketListener::~WebSocketListener() {
    close(nullptr);
}

void WebSocketListener::init(std::shared_ptr<spdlog::logger> logger) {
    if (logger) {
        logger_ = logger;
    }
    if (config_.tls && !config_.tls->context) {
        throw core::InitError("listener " + config_.id + " has TLS material without a context");
    }

    acceptor_.bind(logger_);
    state_ = broker::ListenerState::INITIALIZED;
    logger_->debug("WebSocket listener {} bound to {}", config_.id, config_.address);
}

void WebSocketListener::serve(broker::EstablishFn establish) {
    auto expected = broker::ListenerState::INITIALIZED;
    if (!state_.compare_exchange_strong(expected, broker::ListenerState::SERVING)) {
        if (expected == broker::ListenerState::CLOSED || end_) {
            // close() won the race, nothing to serve
            return;
        }
        logger_->error("Listener {} cannot serve in state {}", config_.id, broker::toString(expected));
        return;
    }

    auto tls = config_.tls;
    std::string id = config_.id;
    acceptor_.run([establish, tls, id](boost::asio::ip::tcp::socket socket) {
        std::string remote = tcp::remoteAddressOf(socket);
        std::shared_ptr<broker::Connection> connection;
        if (tls) {
            connection = std::make_shared<SecureWebSocketConnection>(id, remote, std::move(socket), *tls->context);
        } else {
            connection = std::make_shared<PlainWebSocketConnection>(id, remote, std::move(socket));
        }
        establish(id, std::move(connection));
    });
}

void WebSocketListener::close(broker::CloseFn closeClients) {
    bool expected = false;
    if (!end_.compare_exchange_strong(expected, true)) {
        return;
    }

    state_ = broker::ListenerState::CLOSED;
    acceptor_.stop();
    if (closeClients) {
        closeClients(config_.id);
    }
}

} // namespace websocket
} // namespace protocols
} // namespace server
} // namespace mqttd
