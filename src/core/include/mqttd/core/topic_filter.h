#pragma once

#include <string>
#include <vector>

namespace mqttd {
namespace core {
namespace topic {

/**
 * @brief Splits a topic or filter on '/', keeping empty segments
 */
std::vector<std::string> splitSegments(const std::string& value);

/**
 * @brief Checks that a filter is legal
 *
 * Rejects empty filters, '#' anywhere but as the whole last segment, and '+'
 * sharing a segment with other characters.
 *
 * @throws ConfigError describing the first problem found
 */
void validateFilter(const std::string& filter);

bool isValidFilter(const std::string& filter);

/**
 * @brief Matches a topic name against a filter
 *
 * Segment-exact and case-sensitive. '+' consumes exactly one segment, a
 * final '#' consumes zero or more trailing segments. The filter is expected
 * to have passed validateFilter().
 */
bool filterMatches(const std::string& filter, const std::string& topic);

/**
 * @brief Whether every topic matched by @p specific is also matched by @p general
 */
bool filterCovers(const std::string& general, const std::string& specific);

} // namespace topic
} // namespace core
} // namespace mqttd
