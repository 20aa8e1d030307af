#pragma once

#include <gmock/gmock.h>
#include "mqttd/server/broker/broker.h"
#include "mqttd/server/listener_factory.h"
#include "mqttd/server/protocols/http/http_endpoint_server.h"
#include <condition_variable>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

namespace mqttd {
namespace testing {

class MockConnection : public server::broker::Connection {
public:
    MOCK_METHOD(std::string, listenerId, (), (const, override));
    MOCK_METHOD(std::string, remoteAddress, (), (const, override));
    MOCK_METHOD(std::size_t, read, (char*, std::size_t), (override));
    MOCK_METHOD(void, write, (const char*, std::size_t), (override));
    MOCK_METHOD(void, close, (), (override));
};

class MockListener : public server::broker::IListener {
public:
    MOCK_METHOD(std::string, id, (), (const, override));
    MOCK_METHOD(std::string, address, (), (const, override));
    MOCK_METHOD(std::string, protocol, (), (const, override));
    MOCK_METHOD(void, init, (std::shared_ptr<spdlog::logger>), (override));
    MOCK_METHOD(void, serve, (server::broker::EstablishFn), (override));
    MOCK_METHOD(void, close, (server::broker::CloseFn), (override));
};

class MockHook : public server::broker::IHook {
public:
    MOCK_METHOD(std::string, id, (), (const, override));
    MOCK_METHOD(void, init, (), (override));
    MOCK_METHOD(bool, onConnectAuthenticate, (const core::ClientIdentity&, const std::string&), (override));
    MOCK_METHOD(bool, onAclCheck, (const core::ClientIdentity&, const std::string&, bool), (override));
};

class MockBrokerState : public server::broker::IBrokerState {
public:
    MOCK_METHOD(std::vector<server::broker::ClientSnapshot>, clients, (), (const, override));
    MOCK_METHOD(server::broker::SystemInfo, info, (), (const, override));
};

class MockBroker : public server::broker::IBroker {
public:
    MOCK_METHOD(std::vector<server::broker::ClientSnapshot>, clients, (), (const, override));
    MOCK_METHOD(server::broker::SystemInfo, info, (), (const, override));
    MOCK_METHOD(void, addHook, (std::shared_ptr<server::broker::IHook>), (override));
    MOCK_METHOD(void, addListener, (std::shared_ptr<server::broker::IListener>), (override));
    MOCK_METHOD(void, serve, (), (override));
    MOCK_METHOD(void, close, (), (override));
    MOCK_METHOD(bool, authenticate, (const core::ClientIdentity&, const std::string&), (override));
    MOCK_METHOD(bool, checkAcl, (const core::ClientIdentity&, const std::string&, bool), (override));
    MOCK_METHOD(std::shared_ptr<spdlog::logger>, logger, (), (const, override));
};

class MockListenerFactory : public server::IListenerFactory {
public:
    MOCK_METHOD(std::shared_ptr<server::broker::IListener>, createTcp,
                (const server::broker::ListenerConfig&), (override));
    MOCK_METHOD(std::shared_ptr<server::broker::IListener>, createWebSocket,
                (const server::broker::ListenerConfig&), (override));
    MOCK_METHOD(std::shared_ptr<server::broker::IListener>, createControlPlane,
                (server::protocols::http::ControlPlaneOptions, const server::broker::IBrokerState*), (override));
};

/**
 * @brief In-memory HTTP server: run() blocks until stop()
 */
class FakeHttpServer : public server::protocols::http::IHttpEndpointServer {
public:
    struct Shared {
        std::mutex mutex;
        std::condition_variable cv;
        std::map<std::string, Handler> routes;
        bool running = false;
        bool stopped = false;
        int runCalls = 0;
        int stopCalls = 0;
        bool failOnRun = false;    // throw instead of serving
        bool throwOnStop = false;  // run() throws once stopped
        std::string host;
        uint16_t port = 0;
        bool tls = false;
    };

    explicit FakeHttpServer(std::shared_ptr<Shared> shared) : shared_(std::move(shared)) {}

    void addRoute(const std::string& path, Handler handler) override {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        shared_->routes[path] = std::move(handler);
    }

    void run(const std::string& host, uint16_t port, const server::infrastructure::TlsMaterial* tls) override {
        std::unique_lock<std::mutex> lock(shared_->mutex);
        shared_->runCalls++;
        shared_->host = host;
        shared_->port = port;
        shared_->tls = tls != nullptr;
        if (shared_->failOnRun) {
            throw std::runtime_error("address already in use");
        }
        shared_->running = true;
        shared_->cv.notify_all();
        shared_->cv.wait(lock, [this] { return shared_->stopped; });
        shared_->running = false;
        if (shared_->throwOnStop) {
            throw std::runtime_error("server closed");
        }
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        shared_->stopCalls++;
        shared_->stopped = true;
        shared_->cv.notify_all();
    }

    static bool waitRunning(const std::shared_ptr<Shared>& shared) {
        std::unique_lock<std::mutex> lock(shared->mutex);
        return shared->cv.wait_for(lock, std::chrono::seconds(5), [&] { return shared->running; });
    }

private:
    std::shared_ptr<Shared> shared_;
};

} // namespace testing
} // namespace mqttd
