#pragma once

#include "mqttd/core/ledger.h"
#include <string>
#include <vector>

namespace mqttd {
namespace core {

/**
 * @brief Administrator account injected when the access file lacks it
 *
 * An operational default so a fresh deployment (empty or missing access
 * file) can still be administered. It is not a secret and not a security
 * boundary: operators are expected to define their own user under the
 * same name or disable injection.
 */
struct BootstrapCredential {
    bool enabled = true;
    std::string username = "YoRHa";
    std::string password = "no2typeB";
    std::vector<AccessRule> rules{{"#", PermissionLevel::READ_WRITE}};

    static BootstrapCredential disabled();
};

/**
 * @brief Builds a Ledger from the YAML access file
 *
 * Format:
 * @code
 * <username>:
 *     password: <string>
 *     acl:
 *         <topic filter>: <0..3>
 *     disallow: <bool>
 * @endcode
 */
class LedgerBuilder {
public:
    /**
     * @brief Parses an access file held in memory
     *
     * @param source YAML text
     * @param passwordsObfuscated decode passwords with tryDecodeObfuscated()
     * @throws ParseError when @p source is not well-formed YAML of the
     *         expected shape
     * @throws ConfigError for an illegal filter or level
     */
    static Ledger build(const std::string& source, bool passwordsObfuscated);

    /**
     * @throws ConfigError when @p path is empty or cannot be read
     * @throws ParseError see build()
     */
    static Ledger fromFile(const std::string& path, bool passwordsObfuscated);

    /**
     * @brief Injects the bootstrap administrator when enabled and absent
     *
     * @return true if the credential was added
     */
    static bool applyBootstrap(Ledger& ledger, const BootstrapCredential& credential);

    /**
     * @brief Logs one warning per shadowed rule
     *
     * @return number of warnings
     */
    static size_t logShadowedRules(const Ledger& ledger);

    /**
     * @brief The documented sample access file
     */
    static const std::string& sample();

    /**
     * @throws ConfigError when the file cannot be written
     */
    static void writeSample(const std::string& path);
};

} // namespace core
} // namespace mqttd
