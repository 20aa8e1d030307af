#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace mqttd {
namespace core {

/**
 * @brief Formats a time point as "YYYY-MM-DD hh:mm:ss" in local time
 */
std::string formatTime(std::chrono::system_clock::time_point time);

/**
 * @brief Gets the current timestamp in ISO 8601 format (UTC)
 */
std::string getIsoTimestamp();

/**
 * @brief Renders a duration in seconds as e.g. "2d 3h 4m 5s"
 */
std::string formatDuration(int64_t seconds);

/**
 * @brief Standard base64 encoding (OpenSSL EVP_EncodeBlock)
 */
std::string base64Encode(const std::string& data);

/**
 * @brief Decodes standard base64
 *
 * @return false when @p encoded is not valid padded base64
 */
bool base64Decode(const std::string& encoded, std::string& decoded);

/**
 * @brief Compares two secrets without an early exit on the first difference
 */
bool constantTimeEquals(const std::string& a, const std::string& b);

/**
 * @brief Escapes &, <, >, " and ' for HTML text and attribute content
 */
std::string htmlEscape(const std::string& text);

namespace string_utils {

std::string trim(const std::string& str);

std::string toLower(const std::string& str);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

bool isDigits(const std::string& str);

} // namespace string_utils

} // namespace core
} // namespace mqttd
