#pragma once

#include <string>

namespace mqttd {
namespace core {

/**
 * @brief Access granted by one ACL rule
 *
 * The numeric values are the ones written in the access file. Semantically
 * each level is an independent capability set rather than a rank.
 */
enum class PermissionLevel {
    DENY = 0,
    READ = 1,
    WRITE = 2,
    READ_WRITE = 3
};

/**
 * @brief Direction of a topic operation being authorized
 */
enum class Operation {
    SUBSCRIBE, // read
    PUBLISH    // write
};

enum class Decision {
    DENY,
    ALLOW
};

/**
 * @brief Whether a level grants the given operation
 *
 * Subscribe needs READ or READ_WRITE, publish needs WRITE or READ_WRITE,
 * DENY grants nothing.
 */
bool permits(PermissionLevel level, Operation operation);

/**
 * @brief Converts an access file integer into a level
 *
 * @throws ConfigError when the value is outside 0..3
 */
PermissionLevel permissionFromInt(int value);

int toInt(PermissionLevel level);

const char* toString(PermissionLevel level);
const char* toString(Operation operation);
const char* toString(Decision decision);

} // namespace core
} // namespace mqttd
