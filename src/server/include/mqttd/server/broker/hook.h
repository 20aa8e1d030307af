#pragma once

#include "mqttd/core/ledger.h"
#include <string>

namespace mqttd {
namespace server {
namespace broker {

/**
 * @brief Authentication / authorization hook contract of the broker
 *
 * Consulted from connection threads: implementations must be safe for
 * concurrent calls.
 */
class IHook {
public:
    virtual ~IHook() = default;

    virtual std::string id() const = 0;

    /**
     * @throws ConfigError when the hook is not usable
     */
    virtual void init() = 0;

    virtual bool onConnectAuthenticate(const core::ClientIdentity& client, const std::string& password) = 0;

    /**
     * @param write true for publish, false for subscribe
     */
    virtual bool onAclCheck(const core::ClientIdentity& client, const std::string& topic, bool write) = 0;
};

} // namespace broker
} // namespace server
} // namespace mqttd
