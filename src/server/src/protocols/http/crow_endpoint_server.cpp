#include "mqttd/server/protocols/http/crow_endpoint_server.h"
#include "mqttd/core/utils.h"
#include <spdlog/spdlog.h>
#include <chrono>
#include <future>

namespace mqttd {
namespace server {
namespace protocols {
namespace http {

CrowEndpointServer::CrowEndpointServer()
    : app_(std::make_unique<crow::SimpleApp>()) {
    app_->loglevel(crow::LogLevel::Warning);
}

CrowEndpointServer::~CrowEndpointServer() {
    stop();
}

void CrowEndpointServer::addRoute(const std::string& path, Handler handler) {
    app_->route_dynamic(std::string(path))
        .methods(crow::HTTPMethod::Get)([handler](const crow::request& req) {
            HttpRequest request;
            request.method = crow::method_name(req.method);
            request.path = req.url;
            request.remoteAddress = req.remote_ip_address;
            for (const auto& header : req.headers) {
                request.headers[core::string_utils::toLower(header.first)] = header.second;
            }

            HttpResponse response = handler(request);

            crow::response res(response.status);
            res.set_header("Content-Type", response.contentType);
            for (const auto& header : response.headers) {
                res.set_header(header.first, header.second);
            }
            res.write(response.body);
            return res;
        });
    spdlog::debug("Route registered: GET {}", path);
}

void CrowEndpointServer::run(const std::string& host, uint16_t port, const infrastructure::TlsMaterial* tls) {
    std::future<void> serving;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopRequested_) {
            return;
        }

        app_->bindaddr(host).port(port);
        if (tls) {
            app_->ssl_file(tls->certFile, tls->keyFile);
        }
        serving = app_->multithreaded().run_async();
    }

    // crow::App::stop() is a no-op until run_async has created the server, so a
    // stop landing in that window is repeated here until the server goes down
    while (serving.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopRequested_) {
            app_->stop();
        }
    }
    serving.get();
}

void CrowEndpointServer::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopRequested_ = true;
    app_->stop();
}

} // namespace http
} // namespace protocols
} // namespace server
} // namespace mqttd
