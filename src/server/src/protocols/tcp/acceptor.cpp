#include "mqttd/server/protocols/tcp/acceptor.h"
#include "mqttd/server/infrastructure/address.h"
#include "mqttd/core/errors.h"
#include <boost/asio/ip/address.hpp>
#include <spdlog/spdlog.h>

namespace mqttd {
namespace server {
namespace protocols {
namespace tcp {

using boost::asio::ip::tcp;

Acceptor::Acceptor(std::string address)
    : address_(std::move(address)), acceptor_(ioContext_), logger_(spdlog::default_logger()) {
}

Acceptor::~Acceptor() {
    boost::system::error_code ec;
    acceptor_.close(ec);
}

void Acceptor::bind(std::shared_ptr<spdlog::logger> logger) {
    if (logger) {
        logger_ = logger;
    }

    auto endpoint = infrastructure::parseAddress(address_);
    if (!endpoint) {
        throw core::BindError("malformed listen address: " + address_);
    }

    boost::system::error_code ec;
    auto ip = boost::asio::ip::make_address(endpoint->host, ec);
    if (ec) {
        throw core::BindError("invalid listen host '" + endpoint->host + "': " + ec.message());
    }

    tcp::endpoint bindEndpoint(ip, endpoint->port);
    acceptor_.open(bindEndpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(bindEndpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        throw core::BindError("failed to bind " + address_ + ": " + ec.message());
    }
}

void Acceptor::run(AcceptHandler handler) {
    if (!acceptor_.is_open()) {
        logger_->error("Accept loop on {} started without a bound socket", address_);
        return;
    }

    handler_ = std::move(handler);
    if (stopped_) {
        return;
    }

    doAccept();
    ioContext_.run();

    boost::system::error_code ec;
    acceptor_.close(ec);
}

void Acceptor::stop() {
    stopped_ = true;
    ioContext_.stop();
}

uint16_t Acceptor::port() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void Acceptor::doAccept() {
    acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
        if (stopped_ || ec == boost::asio::error::operation_aborted) {
            return;
        }

        if (ec) {
            logger_->warn("Accept failed on {}: {}", address_, ec.message());
        } else {
            try {
                handler_(std::move(socket));
            } catch (const std::exception& e) {
                logger_->error("Failed to establish connection on {}: {}", address_, e.what());
            }
        }

        doAccept();
    });
}

std::string remoteAddressOf(const tcp::socket& socket) {
    boost::system::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace tcp
} // namespace protocols
} // namespace server
} // namespace mqttd
