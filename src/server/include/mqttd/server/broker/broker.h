#pragma once

#include "mqttd/server/broker/client_info.h"
#include "mqttd/server/broker/hook.h"
#include "mqttd/server/broker/listener.h"
#include <spdlog/logger.h>
#include <memory>
#include <string>
#include <vector>

namespace mqttd {
namespace server {
namespace broker {

/**
 * @brief Read-only view of the broker used by the control plane
 */
class IBrokerState {
public:
    virtual ~IBrokerState() = default;

    virtual std::vector<ClientSnapshot> clients() const = 0;
    virtual SystemInfo info() const = 0;
};

/**
 * @brief The broker side of the listener and hook contracts
 */
class IBroker : public IBrokerState {
public:
    /**
     * @brief Registers an auth hook and calls its init()
     *
     * @throws BindError when the hook fails to initialize
     */
    virtual void addHook(std::shared_ptr<IHook> hook) = 0;

    /**
     * @brief Registers a listener and calls its init()
     *
     * @throws BindError on a duplicate id or when the address is unavailable
     * @throws InitError when the listener cannot be prepared
     */
    virtual void addListener(std::shared_ptr<IListener> listener) = 0;

    /**
     * @brief Starts serving every registered listener on its own thread
     *
     * Returns once the listeners have been dispatched.
     */
    virtual void serve() = 0;

    /**
     * @brief Closes all listeners, waiting a bounded time for each
     */
    virtual void close() = 0;

    virtual bool authenticate(const core::ClientIdentity& client, const std::string& password) = 0;
    virtual bool checkAcl(const core::ClientIdentity& client, const std::string& topic, bool write) = 0;

    virtual std::shared_ptr<spdlog::logger> logger() const = 0;
};

} // namespace broker
} // namespace server
} // namespace mqttd
