#include "mqttd/core/permission.h"
#include "mqttd/core/errors.h"

namespace mqttd {
namespace core {

bool permits(PermissionLevel level, Operation operation) {
    switch (level) {
        case PermissionLevel::READ:
            return operation == Operation::SUBSCRIBE;
        case PermissionLevel::WRITE:
            return operation == Operation::PUBLISH;
        case PermissionLevel::READ_WRITE:
            return true;
        case PermissionLevel::DENY:
        default:
            return false;
    }
}

PermissionLevel permissionFromInt(int value) {
    switch (value) {
        case 0: return PermissionLevel::DENY;
        case 1: return PermissionLevel::READ;
        case 2: return PermissionLevel::WRITE;
        case 3: return PermissionLevel::READ_WRITE;
        default:
            throw ConfigError("permission level must be between 0 and 3, got " + std::to_string(value));
    }
}

int toInt(PermissionLevel level) {
    return static_cast<int>(level);
}

const char* toString(PermissionLevel level) {
    switch (level) {
        case PermissionLevel::DENY: return "deny";
        case PermissionLevel::READ: return "read";
        case PermissionLevel::WRITE: return "write";
        case PermissionLevel::READ_WRITE: return "readwrite";
        default: return "unknown";
    }
}

const char* toString(Operation operation) {
    return operation == Operation::PUBLISH ? "publish" : "subscribe";
}

const char* toString(Decision decision) {
    return decision == Decision::ALLOW ? "allow" : "deny";
}

} // namespace core
} // namespace mqttd
