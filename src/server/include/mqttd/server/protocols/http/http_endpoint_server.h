#pragma once

#include "mqttd/server/infrastructure/tls_material.h"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace mqttd {
namespace server {
namespace protocols {
namespace http {

/**
 * @brief HTTP request as seen by control-plane handlers
 */
struct HttpRequest {
    std::string method = "GET";
    std::string path;
    std::string remoteAddress;
    std::map<std::string, std::string> headers; // lower-case names

    std::string header(const std::string& name) const;
};

struct HttpResponse {
    int status = 200;
    std::string contentType = "text/plain; charset=utf-8";
    std::string body;
    std::map<std::string, std::string> headers;
};

/**
 * @brief Minimal HTTP server seam used by the control-plane listener
 */
class IHttpEndpointServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    virtual ~IHttpEndpointServer() = default;

    /**
     * @brief Registers a GET handler; must be called before run()
     */
    virtual void addRoute(const std::string& path, Handler handler) = 0;

    /**
     * @brief Serves until stop(); throws when the address cannot be used
     *
     * @param tls HTTPS when non-null
     */
    virtual void run(const std::string& host, uint16_t port, const infrastructure::TlsMaterial* tls) = 0;

    virtual void stop() = 0;
};

} // namespace http
} // namespace protocols
} // namespace server
} // namespace mqttd
