#pragma once

#include "mqttd/server/broker/broker.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace mqttd {
namespace server {
namespace broker {

/**
 * @brief Broker host configuration
 */
struct LocalBrokerOptions {
    std::string version = "1.0.0";
    int clientsBufferSize = 8192;
    int maxMessageExpirySeconds = 3600;
    int maxSessionExpirySeconds = 360;
    bool inlineClient = false;
    std::chrono::milliseconds listenerShutdownTimeout{5000};
    std::shared_ptr<spdlog::logger> logger;
};

/**
 * @brief In-process broker host
 *
 * Owns the listeners and hooks, runs every listener on its own thread and
 * keeps the client registry the protocol engine reports into. Accepted
 * connections go to the handler set with setConnectionHandler(); without
 * one they are logged and closed.
 */
class LocalBroker : public IBroker {
public:
    using ConnectionHandler = std::function<void(const std::string& listenerId, std::shared_ptr<Connection>)>;

    explicit LocalBroker(LocalBrokerOptions options = LocalBrokerOptions{});
    ~LocalBroker() override;

    LocalBroker(const LocalBroker&) = delete;
    LocalBroker& operator=(const LocalBroker&) = delete;

    // IBroker
    void addHook(std::shared_ptr<IHook> hook) override;
    void addListener(std::shared_ptr<IListener> listener) override;
    void serve() override;
    void close() override;
    bool authenticate(const core::ClientIdentity& client, const std::string& password) override;
    bool checkAcl(const core::ClientIdentity& client, const std::string& topic, bool write) override;
    std::shared_ptr<spdlog::logger> logger() const override { return logger_; }

    // IBrokerState
    std::vector<ClientSnapshot> clients() const override;
    SystemInfo info() const override;

    void setConnectionHandler(ConnectionHandler handler);

    // Client registry, fed by the protocol engine
    bool clientConnected(ClientSnapshot client);
    bool clientDisconnected(const std::string& clientId);
    bool subscribe(const std::string& clientId, const std::string& filter, int qos);
    bool unsubscribe(const std::string& clientId, const std::string& filter);
    void recordTraffic(int64_t bytesReceived, int64_t bytesSent);
    void recordMessage(bool received);

    /**
     * @brief Drops every registry client that came in through @p listenerId
     */
    void closeListenerClients(const std::string& listenerId);

    size_t listenerCount() const;
    size_t hookCount() const;
    bool isServing() const { return serving_; }

private:
    struct ServedListener {
        std::shared_ptr<IListener> listener;
        std::thread thread;
        std::future<void> done;
    };

    void handleConnection(const std::string& listenerId, std::shared_ptr<Connection> connection);
    std::vector<std::shared_ptr<IHook>> hookSnapshot() const;

    LocalBrokerOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
    std::chrono::system_clock::time_point startTime_;

    mutable std::mutex listenersMutex_;
    std::vector<ServedListener> listeners_;

    mutable std::mutex hooksMutex_;
    std::vector<std::shared_ptr<IHook>> hooks_;

    mutable std::mutex clientsMutex_;
    std::unordered_map<std::string, ClientSnapshot> clients_;

    mutable std::mutex handlerMutex_;
    ConnectionHandler connectionHandler_;

    std::atomic<bool> serving_{false};
    std::atomic<bool> closed_{false};

    std::atomic<int64_t> bytesReceived_{0};
    std::atomic<int64_t> bytesSent_{0};
    std::atomic<int64_t> clientsTotal_{0};
    std::atomic<int64_t> clientsMaximum_{0};
    std::atomic<int64_t> messagesReceived_{0};
    std::atomic<int64_t> messagesSent_{0};
};

} // namespace broker
} // namespace server
} // namespace mqttd
