#pragma once

#include "mqttd/server/broker/hook.h"
#include "mqttd/core/ledger.h"
#include <memory>

namespace mqttd {
namespace server {
namespace auth {

/**
 * @brief Authenticates and authorizes clients against a Ledger
 *
 * The ledger pointer can be swapped while clients are being checked; each
 * check works on the ledger that was current when it started.
 */
class LedgerAuthHook : public broker::IHook {
public:
    explicit LedgerAuthHook(std::shared_ptr<const core::Ledger> ledger);

    std::string id() const override { return "ledger-auth"; }
    void init() override;

    bool onConnectAuthenticate(const core::ClientIdentity& client, const std::string& password) override;
    bool onAclCheck(const core::ClientIdentity& client, const std::string& topic, bool write) override;

    void swapLedger(std::shared_ptr<const core::Ledger> ledger);
    std::shared_ptr<const core::Ledger> ledger() const;

private:
    std::shared_ptr<const core::Ledger> ledger_; // std::atomic_load / std::atomic_store only
};

/**
 * @brief Lets every client connect and use every topic (auth disabled)
 */
class AllowAllHook : public broker::IHook {
public:
    std::string id() const override { return "allow-all-auth"; }
    void init() override {}

    bool onConnectAuthenticate(const core::ClientIdentity&, const std::string&) override { return true; }
    bool onAclCheck(const core::ClientIdentity&, const std::string&, bool) override { return true; }
};

} // namespace auth
} // namespace server
} // namespace mqttd
