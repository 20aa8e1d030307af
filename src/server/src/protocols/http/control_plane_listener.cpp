#include "mqttd/server/protocols/http/control_plane_listener.h"
#include "mqttd/server/protocols/http/crow_endpoint_server.h"
#include "mqttd/server/protocols/http/status_pages.h"
#include "mqttd/server/infrastructure/address.h"
#include "mqttd/core/errors.h"
#include "mqttd/core/utils.h"
#include <spdlog/spdlog.h>

namespace mqttd {
namespace server {
namespace protocols {
namespace http {

namespace {
HttpResponse jsonResponse(std::string body) {
    HttpResponse response;
    response.contentType = "application/json";
    response.body = std::move(body);
    return response;
}
} // namespace

ControlPlaneListener::ControlPlaneListener(ControlPlaneOptions options, const broker::IBrokerState* state,
                                           std::unique_ptr<IHttpEndpointServer> server)
    : options_(std::move(options)),
      brokerState_(state),
      server_(server ? std::move(server) : std::make_unique<CrowEndpointServer>()),
      auth_(options_.credentials),
      recorder_(options_.recorder),
      logger_(spdlog::default_logger()),
      servedFuture_(served_.get_future().share()) {
}

ControlPlaneListener::~ControlPlaneListener() {
    close(nullptr);
}

std::string ControlPlaneListener::protocol() const {
    return options_.listener.tls ? "https" : "http";
}

void ControlPlaneListener::init(std::shared_ptr<spdlog::logger> logger) {
    if (logger) {
        logger_ = logger;
    }
    if (!brokerState_) {
        throw core::InitError("control plane listener " + id() + " has no broker state");
    }

    try {
        server_->addRoute("/connections", guarded([this](const HttpRequest& r) { return connectionsPage(r); }));
        server_->addRoute("/information", guarded([this](const HttpRequest& r) { return information(r); }));
        server_->addRoute("/clientsrawdata", guarded([this](const HttpRequest& r) { return clientsRawData(r); }));
        server_->addRoute("/processrecords", guarded([this](const HttpRequest& r) { return processRecords(r); }));
    } catch (const std::exception& e) {
        throw core::InitError("failed to register control plane routes: " + std::string(e.what()));
    }

    if (!auth_.enabled()) {
        logger_->warn("Control plane listener {} has no credentials, endpoints are open", id());
    }

    recorder_.start();
    state_ = broker::ListenerState::INITIALIZED;
}

void ControlPlaneListener::serve(broker::EstablishFn) {
    auto expected = broker::ListenerState::INITIALIZED;
    if (!state_.compare_exchange_strong(expected, broker::ListenerState::SERVING)) {
        if (expected == broker::ListenerState::CLOSED || end_) {
            // close() won the race, nothing to serve
            return;
        }
        logger_->error("Listener {} cannot serve in state {}", id(), broker::toString(expected));
        return;
    }

    auto endpoint = infrastructure::parseAddress(address());
    if (!endpoint) {
        logger_->error("failed to serve: malformed address {} listener={}", address(), id());
        served_.set_value();
        return;
    }

    logger_->info("Control plane listening on {}://{}", protocol(), address());
    try {
        server_->run(endpoint->host, endpoint->port, options_.listener.tls.get());
        if (!end_) {
            logger_->error("failed to serve: http server returned listener={}", id());
        }
    } catch (const std::exception& e) {
        if (!end_) {
            logger_->error("failed to serve: {} listener={}", e.what(), id());
        }
    }
    served_.set_value();
}

void ControlPlaneListener::close(broker::CloseFn closeClients) {
    bool expected = false;
    if (!end_.compare_exchange_strong(expected, true)) {
        return;
    }

    auto previous = state_.exchange(broker::ListenerState::CLOSED);
    server_->stop();

    if (previous == broker::ListenerState::SERVING &&
        servedFuture_.wait_for(options_.shutdownTimeout) == std::future_status::timeout) {
        core::ShutdownError error("control plane listener " + id() + " did not stop within " +
                                  std::to_string(options_.shutdownTimeout.count()) + " ms");
        logger_->warn("{}", error.what());
    }

    recorder_.stop();
    if (closeClients) {
        closeClients(id());
    }
}

IHttpEndpointServer::Handler ControlPlaneListener::guarded(IHttpEndpointServer::Handler handler) const {
    auto protectedHandler = auth_.protect(std::move(handler));
    return [this, protectedHandler](const HttpRequest& request) {
        try {
            return protectedHandler(request);
        } catch (const std::exception& e) {
            logger_->error("Control plane handler for {} failed: {}", request.path, e.what());
            HttpResponse response;
            response.status = 500;
            response.body = "Internal Server Error";
            return response;
        }
    };
}

HttpResponse ControlPlaneListener::connectionsPage(const HttpRequest&) const {
    StatusPageContext context;
    context.currentTime = core::formatTime(std::chrono::system_clock::now());
    context.uptime = core::formatDuration(brokerState_->info().uptime);
    context.listeners = options_.listenerSummary;

    HttpResponse response;
    response.contentType = "text/html; charset=utf-8";
    response.body = renderConnectionsPage(buildConnectionTable(brokerState_->clients()), context);
    return response;
}

HttpResponse ControlPlaneListener::information(const HttpRequest&) const {
    return jsonResponse(renderInformation(brokerState_->info()));
}

HttpResponse ControlPlaneListener::clientsRawData(const HttpRequest&) const {
    return jsonResponse(renderClientsRawData(brokerState_->clients()));
}

HttpResponse ControlPlaneListener::processRecords(const HttpRequest&) const {
    return jsonResponse(recorder_.toJson().dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
}

} // namespace http
} // namespace protocols
} // namespace server
} // namespace mqttd
