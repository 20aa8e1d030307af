#pragma once

#include <string>

namespace mqttd {
namespace core {

/**
 * Password obfuscation for the access file.
 *
 * This is NOT encryption. The transform (a fixed XOR key stream followed by
 * base64) only keeps passwords from being read over someone's shoulder or
 * grepped out of a config dump. Anyone holding this source can reverse it.
 * Protect the access file with file permissions.
 */

std::string encodeObfuscated(const std::string& plain);

/**
 * @throws ConfigError when @p encoded is not valid obfuscated text
 */
std::string decodeObfuscated(const std::string& encoded);

/**
 * @brief Decodes @p value, or returns it unchanged when it does not decode
 */
std::string tryDecodeObfuscated(const std::string& value);

} // namespace core
} // namespace mqttd
