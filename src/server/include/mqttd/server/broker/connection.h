#pragma once

#include <cstddef>
#include <string>

namespace mqttd {
namespace server {
namespace broker {

/**
 * @brief A client byte stream accepted by a data-plane listener
 *
 * Handed to the protocol engine through the establish callback. I/O is
 * blocking; failures are reported as boost::system::system_error. Any
 * transport handshake (TLS, WebSocket upgrade) happens on first I/O.
 */
class Connection {
public:
    virtual ~Connection() = default;

    virtual std::string listenerId() const = 0;
    virtual std::string remoteAddress() const = 0;

    /**
     * @brief Reads at least one byte, at most @p size
     */
    virtual std::size_t read(char* buffer, std::size_t size) = 0;

    /**
     * @brief Writes all @p size bytes
     */
    virtual void write(const char* data, std::size_t size) = 0;

    /**
     * @brief Closes the stream; never throws
     */
    virtual void close() = 0;
};

} // namespace broker
} // namespace server
} // namespace mqttd
