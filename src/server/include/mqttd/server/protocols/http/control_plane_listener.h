#pragma once

#include "mqttd/server/broker/broker.h"
#include "mqttd/server/broker/listener.h"
#include "mqttd/server/protocols/http/basic_auth.h"
#include "mqttd/server/protocols/http/http_endpoint_server.h"
#include "mqttd/server/protocols/http/process_recorder.h"
#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <string>

namespace mqttd {
namespace server {
namespace protocols {
namespace http {

/**
 * @brief Control-plane listener configuration
 */
struct ControlPlaneOptions {
    broker::ListenerConfig listener;
    std::string listenerSummary;                    // shown on /connections
    std::map<std::string, std::string> credentials; // empty: endpoints are open
    std::chrono::milliseconds shutdownTimeout{5000};
    ProcessRecorder::Options recorder;
};

/**
 * @brief Read-only HTTP diagnostics listener
 *
 * Serves /connections, /information, /clientsrawdata and /processrecords
 * behind Basic-Auth. It never accepts MQTT clients: the establish callback
 * is not used.
 *
 * The broker state is borrowed; the owner of the broker must keep it alive
 * for the listener's lifetime.
 */
class ControlPlaneListener : public broker::IListener {
public:
    ControlPlaneListener(ControlPlaneOptions options, const broker::IBrokerState* state,
                         std::unique_ptr<IHttpEndpointServer> server = nullptr);
    ~ControlPlaneListener() override;

    std::string id() const override { return options_.listener.id; }
    std::string address() const override { return options_.listener.address; }
    std::string protocol() const override;

    void init(std::shared_ptr<spdlog::logger> logger) override;
    void serve(broker::EstablishFn establish) override;
    void close(broker::CloseFn closeClients) override;

    broker::ListenerState state() const { return state_; }
    const ProcessRecorder& recorder() const { return recorder_; }

private:
    HttpResponse connectionsPage(const HttpRequest& request) const;
    HttpResponse information(const HttpRequest& request) const;
    HttpResponse clientsRawData(const HttpRequest& request) const;
    HttpResponse processRecords(const HttpRequest& request) const;

    IHttpEndpointServer::Handler guarded(IHttpEndpointServer::Handler handler) const;

    ControlPlaneOptions options_;
    const broker::IBrokerState* brokerState_;
    std::unique_ptr<IHttpEndpointServer> server_;
    BasicAuthenticator auth_;
    ProcessRecorder recorder_;
    std::shared_ptr<spdlog::logger> logger_;

    std::atomic<broker::ListenerState> state_{broker::ListenerState::CREATED};
    std::atomic<bool> end_{false};
    std::promise<void> served_;
    std::shared_future<void> servedFuture_;
};

} // namespace http
} // namespace protocols
} // namespace server
} // namespace mqttd
