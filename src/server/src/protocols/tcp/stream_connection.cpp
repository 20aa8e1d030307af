#include "mqttd/server/protocols/tcp/stream_connection.h"
#include "mqttd/server/protocols/tcp/acceptor.h"
#include <boost/asio/write.hpp>

namespace mqttd {
namespace server {
namespace protocols {
namespace tcp {

namespace {
void shutdownSocket(boost::asio::ip::tcp::socket& socket) {
    boost::system::error_code ec;
    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket.close(ec);
}
} // namespace

PlainConnection::PlainConnection(std::string listenerId, boost::asio::ip::tcp::socket socket)
    : listenerId_(std::move(listenerId)), remote_(remoteAddressOf(socket)), socket_(std::move(socket)) {
}

std::size_t PlainConnection::read(char* buffer, std::size_t size) {
    return socket_.read_some(boost::asio::buffer(buffer, size));
}

void PlainConnection::write(const char* data, std::size_t size) {
    boost::asio::write(socket_, boost::asio::buffer(data, size));
}

void PlainConnection::close() {
    shutdownSocket(socket_);
}

TlsConnection::TlsConnection(std::string listenerId, boost::asio::ip::tcp::socket socket,
                             boost::asio::ssl::context& context)
    : listenerId_(std::move(listenerId)), remote_(remoteAddressOf(socket)), stream_(std::move(socket), context) {
}

std::size_t TlsConnection::read(char* buffer, std::size_t size) {
    ensureHandshake();
    return stream_.read_some(boost::asio::buffer(buffer, size));
}

void TlsConnection::write(const char* data, std::size_t size) {
    ensureHandshake();
    boost::asio::write(stream_, boost::asio::buffer(data, size));
}

void TlsConnection::close() {
    // No TLS close_notify: the peer may already be gone and shutdown() blocks.
    shutdownSocket(stream_.next_layer());
}

void TlsConnection::ensureHandshake() {
    std::call_once(handshakeOnce_, [this]() {
        stream_.handshake(boost::asio::ssl::stream_base::server);
    });
}

} // namespace tcp
} // namespace protocols
} // namespace server
} // namespace mqttd
