#pragma once

#include "mqttd/server/broker/connection.h"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <mutex>

namespace mqttd {
namespace server {
namespace protocols {
namespace tcp {

/**
 * @brief Plain TCP client stream
 */
class PlainConnection : public broker::Connection {
public:
    PlainConnection(std::string listenerId, boost::asio::ip::tcp::socket socket);

    std::string listenerId() const override { return listenerId_; }
    std::string remoteAddress() const override { return remote_; }
    std::size_t read(char* buffer, std::size_t size) override;
    void write(const char* data, std::size_t size) override;
    void close() override;

private:
    std::string listenerId_;
    std::string remote_;
    boost::asio::ip::tcp::socket socket_;
};

/**
 * @brief TLS client stream; the server handshake runs on first read/write
 */
class TlsConnection : public broker::Connection {
public:
    TlsConnection(std::string listenerId, boost::asio::ip::tcp::socket socket,
                  boost::asio::ssl::context& context);

    std::string listenerId() const override { return listenerId_; }
    std::string remoteAddress() const override { return remote_; }
    std::size_t read(char* buffer, std::size_t size) override;
    void write(const char* data, std::size_t size) override;
    void close() override;

private:
    void ensureHandshake();

    std::string listenerId_;
    std::string remote_;
    boost::asio::ssl::stream<boost::asio::ip::tcp::socket> stream_;
    std::once_flag handshakeOnce_;
};

} // namespace tcp
} // namespace protocols
} // namespace server
} // namespace mqttd
