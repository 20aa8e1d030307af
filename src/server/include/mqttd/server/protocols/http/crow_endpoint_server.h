#pragma once

#include "mqttd/server/protocols/http/http_endpoint_server.h"
#include <crow/app.h>
#include <atomic>
#include <memory>
#include <mutex>

namespace mqttd {
namespace server {
namespace protocols {
namespace http {

/**
 * @brief IHttpEndpointServer backed by a Crow application
 */
class CrowEndpointServer : public IHttpEndpointServer {
public:
    CrowEndpointServer();
    ~CrowEndpointServer() override;

    void addRoute(const std::string& path, Handler handler) override;
    void run(const std::string& host, uint16_t port, const infrastructure::TlsMaterial* tls) override;
    void stop() override;

private:
    std::unique_ptr<crow::SimpleApp> app_;
    std::mutex mutex_;
    std::atomic<bool> stopRequested_{false};
};

} // namespace http
} // namespace protocols
} // namespace server
} // namespace mqttd
