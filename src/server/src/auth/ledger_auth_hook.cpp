#include "mqttd/server/auth/ledger_auth_hook.h"
#include "mqttd/core/acl_matcher.h"
#include "mqttd/core/errors.h"
#include <spdlog/spdlog.h>

namespace mqttd {
namespace server {
namespace auth {

LedgerAuthHook::LedgerAuthHook(std::shared_ptr<const core::Ledger> ledger)
    : ledger_(std::move(ledger)) {
}

void LedgerAuthHook::init() {
    auto current = ledger();
    if (!current) {
        throw core::ConfigError("ledger auth hook requires a ledger");
    }
    spdlog::info("Ledger auth enabled: {} user(s), {} auth rule(s), {} acl rule(s)", current->userCount(),
                 current->authRules().size(), current->aclRules().size());
}

bool LedgerAuthHook::onConnectAuthenticate(const core::ClientIdentity& client, const std::string& password) {
    auto current = ledger();
    if (!current) {
        return false;
    }

    bool allowed = core::AclMatcher::authenticate(*current, client, password);
    if (!allowed) {
        spdlog::info("Authentication failed for client {} (user '{}') from {}", client.clientId,
                     client.username, client.remote);
    }
    return allowed;
}

bool LedgerAuthHook::onAclCheck(const core::ClientIdentity& client, const std::string& topic, bool write) {
    auto current = ledger();
    if (!current) {
        return false;
    }

    auto operation = write ? core::Operation::PUBLISH : core::Operation::SUBSCRIBE;
    auto decision = core::AclMatcher::decide(*current, client, topic, operation);
    if (decision == core::Decision::DENY) {
        spdlog::debug("ACL denied {} on '{}' for user '{}'", core::toString(operation), topic, client.username);
    }
    return decision == core::Decision::ALLOW;
}

void LedgerAuthHook::swapLedger(std::shared_ptr<const core::Ledger> ledger) {
    std::atomic_store(&ledger_, std::move(ledger));
}

std::shared_ptr<const core::Ledger> LedgerAuthHook::ledger() const {
    return std::atomic_load(&ledger_);
}

} // namespace auth
} // namespace server
} // namespace mqttd
