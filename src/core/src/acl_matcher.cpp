#include "mqttd/core/acl_matcher.h"
#include "mqttd/core/topic_filter.h"
#include "mqttd/core/utils.h"

namespace mqttd {
namespace core {

std::optional<Decision> AclMatcher::firstMatch(const std::vector<AccessRule>& rules,
                                               const std::string& topic, Operation operation) {
    for (const auto& rule : rules) {
        if (topic::filterMatches(rule.filter, topic)) {
            return permits(rule.level, operation) ? Decision::ALLOW : Decision::DENY;
        }
    }
    return std::nullopt;
}

Decision AclMatcher::decide(const UserRecord& user, const std::string& topic, Operation operation) {
    auto decision = firstMatch(user.rules, topic, operation);
    return decision.value_or(Decision::DENY);
}

Decision AclMatcher::decide(const Ledger& ledger, const ClientIdentity& client,
                            const std::string& topic, Operation operation) {
    if (const auto* user = ledger.findUser(client.username)) {
        if (auto decision = firstMatch(user->rules, topic, operation)) {
            return *decision;
        }
    }

    for (const auto& rule : ledger.aclRules()) {
        if (!rule.appliesTo(client)) {
            continue;
        }
        if (auto decision = firstMatch(rule.filters, topic, operation)) {
            return *decision;
        }
    }

    return Decision::DENY;
}

bool AclMatcher::authenticate(const Ledger& ledger, const ClientIdentity& client,
                              const std::string& password) {
    if (const auto* user = ledger.findUser(client.username)) {
        if (!user->password.empty() && constantTimeEquals(user->password, password)) {
            return true;
        }
    }

    for (const auto& rule : ledger.authRules()) {
        if (rule.appliesTo(client, password)) {
            return rule.allow;
        }
    }

    return false;
}

} // namespace core
} // namespace mqttd
