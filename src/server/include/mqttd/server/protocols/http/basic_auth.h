#pragma once

#include "mqttd/server/protocols/http/http_endpoint_server.h"
#include <map>
#include <string>

namespace mqttd {
namespace server {
namespace protocols {
namespace http {

/**
 * @brief HTTP Basic-Auth against a fixed username/password snapshot
 *
 * With an empty snapshot every request is let through.
 */
class BasicAuthenticator {
public:
    explicit BasicAuthenticator(std::map<std::string, std::string> credentials = {},
                                std::string realm = "mqttd");

    bool enabled() const { return !credentials_.empty(); }

    /**
     * @param authorization value of the Authorization header
     */
    bool check(const std::string& authorization) const;

    /**
     * @brief 401 response carrying the WWW-Authenticate challenge
     */
    HttpResponse challenge() const;

    /**
     * @brief Wraps @p handler so that it only runs for authorized requests
     */
    IHttpEndpointServer::Handler protect(IHttpEndpointServer::Handler handler) const;

    /**
     * @brief Splits "Basic <base64(user:password)>"
     */
    static bool parseHeader(const std::string& authorization, std::string& username, std::string& password);

private:
    std::map<std::string, std::string> credentials_;
    std::string realm_;
};

} // namespace http
} // namespace protocols
} // namespace server
} // namespace mqttd
