#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <spdlog/logger.h>
#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace mqttd {
namespace server {
namespace protocols {
namespace tcp {

/**
 * @brief Asynchronous accept loop over one bound address
 *
 * Shared by the TCP and WebSocket listeners. bind() is called from
 * IListener::init, run() from IListener::serve and blocks until stop().
 */
class Acceptor {
public:
    using AcceptHandler = std::function<void(boost::asio::ip::tcp::socket socket)>;

    explicit Acceptor(std::string address);
    ~Acceptor();

    Acceptor(const Acceptor&) = delete;
    Acceptor& operator=(const Acceptor&) = delete;

    /**
     * @throws BindError when the address is malformed or cannot be bound
     */
    void bind(std::shared_ptr<spdlog::logger> logger);

    void run(AcceptHandler handler);
    void stop();

    bool isBound() const { return acceptor_.is_open(); }

    /**
     * @brief The bound port (useful when binding port 0)
     */
    uint16_t port() const;

private:
    void doAccept();

    std::string address_;
    boost::asio::io_context ioContext_;
    boost::asio::ip::tcp::acceptor acceptor_;
    AcceptHandler handler_;
    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<bool> stopped_{false};
};

/**
 * @brief "ip:port" of a connected socket, or "unknown"
 */
std::string remoteAddressOf(const boost::asio::ip::tcp::socket& socket);

} // namespace tcp
} // namespace protocols
} // namespace server
} // namespace mqttd
