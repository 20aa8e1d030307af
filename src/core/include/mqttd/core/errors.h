#pragma once

#include <exception>
#include <string>

namespace mqttd {
namespace core {

/**
 * @brief Error category enumeration
 */
enum class ErrorCategory {
    PARSE,
    CONFIGURATION,
    NETWORK,
    INITIALIZATION,
    SHUTDOWN,
    UNKNOWN
};

/**
 * @brief Base class of every exception raised by mqttd
 *
 * Carries a short machine-readable error code next to the message so that
 * callers can log or map failures without parsing what().
 */
class MqttdException : public std::exception {
public:
    MqttdException(const std::string& errorCode, const std::string& message,
                   ErrorCategory category = ErrorCategory::UNKNOWN);

    const char* what() const noexcept override;
    const std::string& getErrorCode() const;
    ErrorCategory getCategory() const;

private:
    std::string errorCode_;
    std::string message_;
    ErrorCategory category_;
};

/**
 * @brief The access file is not well-formed structured data
 */
class ParseError : public MqttdException {
public:
    explicit ParseError(const std::string& message);
};

/**
 * @brief Well-formed input with illegal content (bad filter, bad level, missing file)
 */
class ConfigError : public MqttdException {
public:
    explicit ConfigError(const std::string& message);
};

/**
 * @brief A listener or hook could not acquire its address or register
 */
class BindError : public MqttdException {
public:
    explicit BindError(const std::string& message);
};

/**
 * @brief A listener failed to prepare its handlers
 */
class InitError : public MqttdException {
public:
    explicit InitError(const std::string& message);
};

/**
 * @brief A listener did not stop within its shutdown timeout
 */
class ShutdownError : public MqttdException {
public:
    explicit ShutdownError(const std::string& message);
};

const char* toString(ErrorCategory category);

} // namespace core
} // namespace mqttd
