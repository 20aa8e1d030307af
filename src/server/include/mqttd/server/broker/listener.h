#pragma once

#include "mqttd/server/broker/connection.h"
#include "mqttd/server/infrastructure/tls_material.h"
#include <spdlog/logger.h>
#include <functional>
#include <memory>
#include <string>

namespace mqttd {
namespace server {
namespace broker {

/**
 * @brief Called by a listener for every accepted client stream
 *
 * Runs on the listener's accept thread and must hand the connection off
 * without blocking on it.
 */
using EstablishFn = std::function<void(const std::string& listenerId, std::shared_ptr<Connection> connection)>;

/**
 * @brief Called once by a listener while closing, to drop its clients
 */
using CloseFn = std::function<void(const std::string& listenerId)>;

/**
 * @brief Lifecycle of a listener
 */
enum class ListenerState {
    CREATED,
    INITIALIZED,
    SERVING,
    CLOSED
};

const char* toString(ListenerState state);

/**
 * @brief Construction parameters shared by all listeners
 */
struct ListenerConfig {
    std::string id;
    std::string address;
    std::shared_ptr<const infrastructure::TlsMaterial> tls; // null: plaintext
};

/**
 * @brief Listener plugin contract of the broker
 *
 * The broker calls init() when the listener is added, then serve() on a
 * dedicated thread, and close() at shutdown. close() may be called from
 * any thread, any number of times.
 */
class IListener {
public:
    virtual ~IListener() = default;

    virtual std::string id() const = 0;
    virtual std::string address() const = 0;
    virtual std::string protocol() const = 0;

    /**
     * @throws BindError when the address cannot be acquired
     * @throws InitError when the listener cannot prepare its handlers
     */
    virtual void init(std::shared_ptr<spdlog::logger> logger) = 0;

    /**
     * @brief Blocks serving until close() is called
     */
    virtual void serve(EstablishFn establish) = 0;

    virtual void close(CloseFn closeClients) = 0;
};

} // namespace broker
} // namespace server
} // namespace mqttd
