#include "mqttd/core/ledger.h"
#include "mqttd/core/topic_filter.h"
#include "mqttd/core/utils.h"

namespace mqttd {
namespace core {

namespace {

void validateRules(const std::vector<AccessRule>& rules) {
    for (const auto& rule : rules) {
        topic::validateFilter(rule.filter);
    }
}

void collectShadowed(const std::string& owner, const std::vector<AccessRule>& rules,
                     std::vector<std::string>& out) {
    for (size_t later = 1; later < rules.size(); ++later) {
        for (size_t earlier = 0; earlier < later; ++earlier) {
            if (topic::filterCovers(rules[earlier].filter, rules[later].filter)) {
                out.push_back(owner + ": rule '" + rules[later].filter + "' (" +
                              toString(rules[later].level) + ") is shadowed by earlier rule '" +
                              rules[earlier].filter + "' (" + toString(rules[earlier].level) + ")");
                break;
            }
        }
    }
}

} // namespace

bool fieldMatches(const std::string& pattern, const std::string& value) {
    if (pattern.empty() || pattern == "*" || pattern == value) {
        return true;
    }
    if (pattern.back() == '*') {
        auto prefix = pattern.substr(0, pattern.size() - 1);
        return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
    }
    return false;
}

bool AuthRule::appliesTo(const ClientIdentity& identity, const std::string& suppliedPassword) const {
    return fieldMatches(client, identity.clientId) &&
           fieldMatches(username, identity.username) &&
           fieldMatches(remote, identity.remote) &&
           (password.empty() || constantTimeEquals(password, suppliedPassword));
}

bool AclRule::appliesTo(const ClientIdentity& identity) const {
    return fieldMatches(client, identity.clientId) &&
           fieldMatches(username, identity.username) &&
           fieldMatches(remote, identity.remote);
}

bool Ledger::addUser(UserRecord user) {
    validateRules(user.rules);
    if (user.disallowed) {
        return false;
    }
    if (users_.count(user.username) > 0) {
        return false;
    }
    auto name = user.username;
    users_.emplace(std::move(name), std::move(user));
    return true;
}

void Ledger::addAuthRule(AuthRule rule) {
    authRules_.push_back(std::move(rule));
}

void Ledger::addAclRule(AclRule rule) {
    validateRules(rule.filters);
    aclRules_.push_back(std::move(rule));
}

bool Ledger::hasUser(const std::string& username) const {
    return users_.count(username) > 0;
}

const UserRecord* Ledger::findUser(const std::string& username) const {
    auto it = users_.find(username);
    return it != users_.end() ? &it->second : nullptr;
}

std::map<std::string, std::string> Ledger::credentials() const {
    std::map<std::string, std::string> result;
    for (const auto& rule : authRules_) {
        if (!rule.username.empty() && rule.username.find('*') == std::string::npos &&
            !rule.password.empty()) {
            result[rule.username] = rule.password;
        }
    }
    for (const auto& pair : users_) {
        if (!pair.first.empty() && !pair.second.password.empty()) {
            result[pair.first] = pair.second.password;
        }
    }
    return result;
}

std::vector<std::string> Ledger::findShadowedRules() const {
    std::vector<std::string> warnings;
    for (const auto& pair : users_) {
        collectShadowed("user " + pair.first, pair.second.rules, warnings);
    }
    for (size_t i = 0; i < aclRules_.size(); ++i) {
        collectShadowed("acl rule #" + std::to_string(i), aclRules_[i].filters, warnings);
    }
    return warnings;
}

} // namespace core
} // namespace mqttd
