#include "mqttd/core/errors.h"

namespace mqttd {
namespace core {

MqttdException::MqttdException(const std::string& errorCode, const std::string& message,
                               ErrorCategory category)
    : errorCode_(errorCode), message_(message), category_(category) {
}

const char* MqttdException::what() const noexcept {
    return message_.c_str();
}

const std::string& MqttdException::getErrorCode() const {
    return errorCode_;
}

ErrorCategory MqttdException::getCategory() const {
    return category_;
}

ParseError::ParseError(const std::string& message)
    : MqttdException("PARSE_ERROR", message, ErrorCategory::PARSE) {
}

ConfigError::ConfigError(const std::string& message)
    : MqttdException("CONFIG_ERROR", message, ErrorCategory::CONFIGURATION) {
}

BindError::BindError(const std::string& message)
    : MqttdException("BIND_ERROR", message, ErrorCategory::NETWORK) {
}

InitError::InitError(const std::string& message)
    : MqttdException("INIT_ERROR", message, ErrorCategory::INITIALIZATION) {
}

ShutdownError::ShutdownError(const std::string& message)
    : MqttdException("SHUTDOWN_ERROR", message, ErrorCategory::SHUTDOWN) {
}

const char* toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::PARSE: return "parse";
        case ErrorCategory::CONFIGURATION: return "configuration";
        case ErrorCategory::NETWORK: return "network";
        case ErrorCategory::INITIALIZATION: return "initialization";
        case ErrorCategory::SHUTDOWN: return "shutdown";
        default: return "unknown";
    }
}

} // namespace core
} // namespace mqttd
