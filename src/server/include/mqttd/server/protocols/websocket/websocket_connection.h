#pragma once

#include "mqttd/server/broker/connection.h"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <algorithm>
#include <mutex>

namespace mqttd {
namespace server {
namespace protocols {
namespace websocket {

namespace detail {

inline boost::asio::ip::tcp::socket& lowestLayer(boost::asio::ip::tcp::socket& socket) {
    return socket;
}

inline boost::asio::ip::tcp::socket& lowestLayer(boost::asio::ssl::stream<boost::asio::ip::tcp::socket>& stream) {
    return stream.next_layer();
}

inline void serverHandshake(boost::asio::ip::tcp::socket&) {
}

inline void serverHandshake(boost::asio::ssl::stream<boost::asio::ip::tcp::socket>& stream) {
    stream.handshake(boost::asio::ssl::stream_base::server);
}

} // namespace detail

/**
 * @brief MQTT-over-WebSocket client stream
 *
 * The (TLS handshake and) WebSocket upgrade run on first read/write. The
 * server answers with the "mqtt" sub-protocol and sends binary frames;
 * reads hand out the payload of incoming frames as a byte stream.
 */
template <class NextLayer>
class WebSocketConnection : public broker::Connection {
public:
    template <class... Args>
    WebSocketConnection(std::string listenerId, std::string remote, Args&&... args)
        : listenerId_(std::move(listenerId)), remote_(std::move(remote)), ws_(std::forward<Args>(args)...) {
    }

    std::string listenerId() const override { return listenerId_; }
    std::string remoteAddress() const override { return remote_; }

    std::size_t read(char* buffer, std::size_t size) override {
        ensureAccepted();
        while (frame_.size() == 0) {
            ws_.read(frame_);
        }
        std::size_t copied = boost::asio::buffer_copy(boost::asio::buffer(buffer, size), frame_.data());
        frame_.consume(copied);
        return copied;
    }

    void write(const char* data, std::size_t size) override {
        ensureAccepted();
        ws_.write(boost::asio::buffer(data, size));
    }

    void close() override {
        boost::system::error_code ec;
        auto& socket = detail::lowestLayer(ws_.next_layer());
        socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }

private:
    void ensureAccepted() {
        std::call_once(acceptOnce_, [this]() {
            detail::serverHandshake(ws_.next_layer());
            ws_.set_option(boost::beast::websocket::stream_base::decorator(
                [](boost::beast::websocket::response_type& res) {
                    res.set(boost::beast::http::field::sec_websocket_protocol, "mqtt");
                }));
            ws_.binary(true);
            ws_.accept();
        });
    }

    std::string listenerId_;
    std::string remote_;
    boost::beast::websocket::stream<NextLayer> ws_;
    boost::beast::flat_buffer frame_;
    std::once_flag acceptOnce_;
};

using PlainWebSocketConnection = WebSocketConnection<boost::asio::ip::tcp::socket>;
using SecureWebSocketConnection = WebSocketConnection<boost::asio::ssl::stream<boost::asio::ip::tcp::socket>>;

} // namespace websocket
} // namespace protocols
} // namespace server
} // namespace mqttd
