#include "mqttd/server/protocols/http/basic_auth.h"
#include "mqttd/core/utils.h"
#include <spdlog/spdlog.h>

namespace mqttd {
namespace server {
namespace protocols {
namespace http {

BasicAuthenticator::BasicAuthenticator(std::map<std::string, std::string> credentials, std::string realm)
    : credentials_(std::move(credentials)), realm_(std::move(realm)) {
}

bool BasicAuthenticator::check(const std::string& authorization) const {
    if (!enabled()) {
        return true;
    }

    std::string username;
    std::string password;
    if (!parseHeader(authorization, username, password)) {
        return false;
    }

    auto it = credentials_.find(username);
    if (it == credentials_.end()) {
        return false;
    }
    return core::constantTimeEquals(it->second, password);
}

HttpResponse BasicAuthenticator::challenge() const {
    HttpResponse response;
    response.status = 401;
    response.body = "Unauthorized";
    response.headers["WWW-Authenticate"] = "Basic realm=\"" + realm_ + "\", charset=\"UTF-8\"";
    return response;
}

IHttpEndpointServer::Handler BasicAuthenticator::protect(IHttpEndpointServer::Handler handler) const {
    BasicAuthenticator auth = *this;
    return [auth, handler](const HttpRequest& request) {
        if (!auth.check(request.header("Authorization"))) {
            spdlog::debug("Rejected unauthorized request for {} from {}", request.path, request.remoteAddress);
            return auth.challenge();
        }
        return handler(request);
    };
}

bool BasicAuthenticator::parseHeader(const std::string& authorization, std::string& username,
                                     std::string& password) {
    std::string value = core::string_utils::trim(authorization);
    const std::string scheme = "basic ";
    if (value.size() <= scheme.size() || core::string_utils::toLower(value.substr(0, scheme.size())) != scheme) {
        return false;
    }

    std::string decoded;
    if (!core::base64Decode(core::string_utils::trim(value.substr(scheme.size())), decoded)) {
        return false;
    }

    auto colon = decoded.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    username = decoded.substr(0, colon);
    password = decoded.substr(colon + 1);
    return true;
}

} // namespace http
} // namespace protocols
} // namespace server
} // namespace mqttd
