#include "mqttd/core/ledger_builder.h"
#include "mqttd/core/errors.h"
#include "mqttd/core/obfuscation.h"
#include "mqttd/core/topic_filter.h"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace mqttd {
namespace core {

namespace {

const std::string kSampleAccessFile = R"(# mqttd access file
#
# <username>:
#     password: <plaintext, or obfuscated text when started with --coded-pwd>
#     acl:                       # checked top to bottom, the first matching filter decides
#         <topic filter>: <0 deny | 1 read | 2 write | 3 read and write>
#     disallow: <true removes the user entirely>
#
# Users without a matching rule are denied.
aclsample:
    password: lostjudgment
    acl:
        deny/#: 0
        read/#: 1
        write/#: 2
        rw/#: 3
    disallow: true
control:
    password: daysgone
    acl:
        down/#: 3
        up/#: 3
user01:
    password: concord
    acl:
        down/+/user01/#: 1
        up/+/user01/#: 2
)";

// yaml-cpp renders a Null scalar ("key:" or "key: ~") as "null"
std::string scalarOrEmpty(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return "";
    }
    return node.as<std::string>();
}

UserRecord parseUser(const std::string& username, const YAML::Node& node, bool passwordsObfuscated) {
    if (!node.IsMap()) {
        throw ParseError("entry for user '" + username + "' must be a mapping");
    }

    UserRecord user;
    user.username = username;

    const YAML::Node disallow = node["disallow"];
    if (disallow && !disallow.IsNull()) {
        user.disallowed = disallow.as<bool>();
    }

    auto password = scalarOrEmpty(node["password"]);
    if (!password.empty()) {
        user.password = passwordsObfuscated ? tryDecodeObfuscated(password) : password;
    }

    const YAML::Node acl = node["acl"];
    if (acl && !acl.IsNull()) {
        if (!acl.IsMap()) {
            throw ParseError("acl of user '" + username + "' must be a mapping");
        }
        for (const auto& entry : acl) {
            AccessRule rule;
            rule.filter = scalarOrEmpty(entry.first);
            topic::validateFilter(rule.filter);
            rule.level = permissionFromInt(entry.second.as<int>());
            user.rules.push_back(rule);
        }
    }

    return user;
}

} // namespace

BootstrapCredential BootstrapCredential::disabled() {
    BootstrapCredential credential;
    credential.enabled = false;
    return credential;
}

Ledger LedgerBuilder::build(const std::string& source, bool passwordsObfuscated) {
    Ledger ledger;
    size_t dropped = 0;

    try {
        YAML::Node root = YAML::Load(source);
        if (root.IsNull()) {
            spdlog::info("Access file is empty, ledger has no users");
            return ledger;
        }
        if (!root.IsMap()) {
            throw ParseError("access file must be a mapping of username to user entry");
        }

        for (const auto& entry : root) {
            auto username = scalarOrEmpty(entry.first);
            if (username.empty()) {
                throw ParseError("access file has an entry without a username");
            }
            auto user = parseUser(username, entry.second, passwordsObfuscated);

            if (user.disallowed) {
                spdlog::debug("User {} is disallowed, leaving it out of the ledger", username);
                ++dropped;
                continue;
            }
            if (user.password.empty()) {
                spdlog::warn("User {} has no password and will never authenticate", username);
            }
            if (!ledger.addUser(std::move(user))) {
                throw ConfigError("duplicate user '" + username + "'");
            }
        }
    } catch (const YAML::Exception& e) {
        throw ParseError(std::string("malformed access file: ") + e.what());
    }

    spdlog::info("Ledger built with {} users ({} disallowed)", ledger.userCount(), dropped);
    return ledger;
}

Ledger LedgerBuilder::fromFile(const std::string& path, bool passwordsObfuscated) {
    if (path.empty()) {
        throw ConfigError("access file name is empty");
    }

    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open access file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    spdlog::info("Loading access file {}", path);
    return build(buffer.str(), passwordsObfuscated);
}

bool LedgerBuilder::applyBootstrap(Ledger& ledger, const BootstrapCredential& credential) {
    if (!credential.enabled || credential.username.empty() || ledger.hasUser(credential.username)) {
        return false;
    }

    UserRecord admin;
    admin.username = credential.username;
    admin.password = credential.password;
    admin.rules = credential.rules;
    ledger.addUser(std::move(admin));

    spdlog::warn("Injected default administrator '{}'; define this user in the access file "
                 "to override the built-in password", credential.username);
    return true;
}

size_t LedgerBuilder::logShadowedRules(const Ledger& ledger) {
    auto warnings = ledger.findShadowedRules();
    for (const auto& warning : warnings) {
        spdlog::warn("ACL {}", warning);
    }
    return warnings.size();
}

const std::string& LedgerBuilder::sample() {
    return kSampleAccessFile;
}

void LedgerBuilder::writeSample(const std::string& path) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        throw ConfigError("cannot write sample access file: " + path);
    }
    file << kSampleAccessFile;
    if (!file) {
        throw ConfigError("failed writing sample access file: " + path);
    }
    spdlog::info("Sample access file written to {}", path);
}

} // namespace core
} // namespace mqttd
