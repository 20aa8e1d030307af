#pragma once

#include "mqttd/core/ledger.h"
#include "mqttd/core/permission.h"
#include <optional>
#include <string>
#include <vector>

namespace mqttd {
namespace core {

/**
 * @brief Allow/deny decisions against a Ledger
 *
 * Stateless; every function only reads its arguments and is safe to call
 * from any number of threads at once. Rule lists are evaluated in order and
 * the first matching filter decides (first-match-wins). When nothing
 * matches the answer is DENY.
 */
class AclMatcher {
public:
    /**
     * @brief Decision of the first rule in @p rules whose filter matches
     *
     * @return std::nullopt when no filter matches
     */
    static std::optional<Decision> firstMatch(const std::vector<AccessRule>& rules,
                                              const std::string& topic, Operation operation);

    /**
     * @brief Decides an operation for one user record
     */
    static Decision decide(const UserRecord& user, const std::string& topic, Operation operation);

    /**
     * @brief Decides an operation for a connected client
     *
     * The user's own rules are consulted first, then the ledger's global ACL
     * rules that apply to the client.
     */
    static Decision decide(const Ledger& ledger, const ClientIdentity& client,
                           const std::string& topic, Operation operation);

    /**
     * @brief Checks the credentials a client presented on connect
     */
    static bool authenticate(const Ledger& ledger, const ClientIdentity& client,
                             const std::string& password);
};

} // namespace core
} // namespace mqttd
