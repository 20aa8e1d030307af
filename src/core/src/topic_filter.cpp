#include "mqttd/core/topic_filter.h"
#include "mqttd/core/errors.h"

namespace mqttd {
namespace core {
namespace topic {

std::vector<std::string> splitSegments(const std::string& value) {
    std::vector<std::string> segments;
    std::string::size_type start = 0;
    while (true) {
        auto pos = value.find('/', start);
        if (pos == std::string::npos) {
            segments.push_back(value.substr(start));
            break;
        }
        segments.push_back(value.substr(start, pos - start));
        start = pos + 1;
    }
    return segments;
}

void validateFilter(const std::string& filter) {
    if (filter.empty()) {
        throw ConfigError("topic filter must not be empty");
    }

    auto segments = splitSegments(filter);
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& segment = segments[i];
        if (segment.find('#') != std::string::npos) {
            if (segment != "#") {
                throw ConfigError("'#' must occupy a whole segment in filter '" + filter + "'");
            }
            if (i + 1 != segments.size()) {
                throw ConfigError("'#' must be the last segment in filter '" + filter + "'");
            }
        }
        if (segment.find('+') != std::string::npos && segment != "+") {
            throw ConfigError("'+' must occupy a whole segment in filter '" + filter + "'");
        }
    }
}

bool isValidFilter(const std::string& filter) {
    try {
        validateFilter(filter);
        return true;
    } catch (const ConfigError&) {
        return false;
    }
}

bool filterMatches(const std::string& filter, const std::string& topic) {
    auto filterSegments = splitSegments(filter);
    auto topicSegments = splitSegments(topic);

    for (size_t i = 0; i < filterSegments.size(); ++i) {
        const auto& segment = filterSegments[i];
        if (segment == "#") {
            return true;
        }
        if (i >= topicSegments.size()) {
            return false;
        }
        if (segment == "+") {
            continue;
        }
        if (segment != topicSegments[i]) {
            return false;
        }
    }

    return filterSegments.size() == topicSegments.size();
}

bool filterCovers(const std::string& general, const std::string& specific) {
    auto generalSegments = splitSegments(general);
    auto specificSegments = splitSegments(specific);

    for (size_t i = 0; i < generalSegments.size(); ++i) {
        const auto& segment = generalSegments[i];
        if (segment == "#") {
            return true;
        }
        if (i >= specificSegments.size() || specificSegments[i] == "#") {
            return false;
        }
        if (segment == "+") {
            continue;
        }
        if (specificSegments[i] == "+" || segment != specificSegments[i]) {
            return false;
        }
    }

    return generalSegments.size() == specificSegments.size();
}

} // namespace topic
} // namespace core
} // namespace mqttd
