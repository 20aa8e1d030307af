#pragma once

#include "mqttd/core/permission.h"
#include <map>
#include <string>
#include <vector>

namespace mqttd {
namespace core {

/**
 * @brief One (topic filter, level) pair of an access control list
 */
struct AccessRule {
    std::string filter;
    PermissionLevel level = PermissionLevel::DENY;
};

/**
 * @brief Credentials and ordered ACL of one user
 *
 * The password is plaintext at evaluation time. A disallowed record never
 * makes it into a Ledger.
 */
struct UserRecord {
    std::string username;
    std::string password;
    std::vector<AccessRule> rules;
    bool disallowed = false;
};

/**
 * @brief Who is asking: the identity a connecting client presented
 */
struct ClientIdentity {
    std::string clientId;
    std::string username;
    std::string remote;
};

/**
 * @brief Matches a rule field against a client value
 *
 * Empty and "*" match anything, a trailing '*' is a prefix match, anything
 * else must be equal.
 */
bool fieldMatches(const std::string& pattern, const std::string& value);

/**
 * @brief Global auth-only entry, consulted when no user record authenticates
 */
struct AuthRule {
    std::string client;
    std::string username;
    std::string remote;
    std::string password; // empty matches any password
    bool allow = false;

    bool appliesTo(const ClientIdentity& identity, const std::string& suppliedPassword) const;
};

/**
 * @brief Global ACL-only entry, consulted after the user's own rules
 */
struct AclRule {
    std::string client;
    std::string username;
    std::string remote;
    std::vector<AccessRule> filters;

    bool appliesTo(const ClientIdentity& identity) const;
};

/**
 * @brief In-memory ledger of users, auth rules and ACL rules
 *
 * Assembled once (by LedgerBuilder or in code) and then shared as
 * std::shared_ptr<const Ledger>; nothing mutates it after that, so
 * concurrent readers need no locking.
 */
class Ledger {
public:
    Ledger() = default;

    /**
     * @brief Adds a user record
     *
     * Disallowed records are dropped. Every filter is validated.
     *
     * @return false if a user with that name already exists (the existing
     *         record is kept) or the record was dropped
     * @throws ConfigError for an illegal filter
     */
    bool addUser(UserRecord user);

    void addAuthRule(AuthRule rule);

    /**
     * @throws ConfigError for an illegal filter
     */
    void addAclRule(AclRule rule);

    bool hasUser(const std::string& username) const;
    const UserRecord* findUser(const std::string& username) const;

    const std::map<std::string, UserRecord>& users() const { return users_; }
    const std::vector<AuthRule>& authRules() const { return authRules_; }
    const std::vector<AclRule>& aclRules() const { return aclRules_; }
    size_t userCount() const { return users_.size(); }

    /**
     * @brief Username/password pairs usable for HTTP Basic-Auth
     *
     * Users with a non-empty name and password, plus auth rules with a
     * literal username and a password. User records win on conflicts.
     */
    std::map<std::string, std::string> credentials() const;

    /**
     * @brief Describes rules that can never match because an earlier rule
     *        of the same list covers them
     */
    std::vector<std::string> findShadowedRules() const;

private:
    std::map<std::string, UserRecord> users_;
    std::vector<AuthRule> authRules_;
    std::vector<AclRule> aclRules_;
};

} // namespace core
} // namespace mqttd
