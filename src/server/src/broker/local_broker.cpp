#include "mqttd/server/broker/local_broker.h"
#include "mqttd/core/errors.h"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <algorithm>
#include <fstream>

namespace mqttd {
namespace server {
namespace broker {

namespace {
const char* INLINE_CLIENT_ID = "inline";
const char* LOCAL_LISTENER_ID = "local";

int64_t residentBytes() {
    std::ifstream statm("/proc/self/statm");
    int64_t size = 0;
    int64_t resident = 0;
    if (!(statm >> size >> resident)) {
        return 0;
    }
    return resident * static_cast<int64_t>(sysconf(_SC_PAGESIZE));
}
} // namespace

LocalBroker::LocalBroker(LocalBrokerOptions options)
    : options_(std::move(options)),
      logger_(options_.logger ? options_.logger : spdlog::default_logger()),
      startTime_(std::chrono::system_clock::now()) {
    if (options_.inlineClient) {
        ClientSnapshot inlineClient;
        inlineClient.id = INLINE_CLIENT_ID;
        inlineClient.listener = LOCAL_LISTENER_ID;
        inlineClient.remote = LOCAL_LISTENER_ID;
        inlineClient.protocolVersion = 5;
        inlineClient.inlineClient = true;
        inlineClient.connectedAt = startTime_;
        clients_[inlineClient.id] = inlineClient;
    }
    logger_->debug("Broker host created (version {}, buffer {} bytes)", options_.version,
                   options_.clientsBufferSize);
}

LocalBroker::~LocalBroker() {
    close();
}

void LocalBroker::addHook(std::shared_ptr<IHook> hook) {
    if (!hook) {
        throw core::BindError("cannot add a null hook");
    }

    try {
        hook->init();
    } catch (const std::exception& e) {
        throw core::BindError("failed to initialize hook " + hook->id() + ": " + e.what());
    }

    std::lock_guard<std::mutex> lock(hooksMutex_);
    hooks_.push_back(std::move(hook));
    logger_->info("Added hook: {}", hooks_.back()->id());
}

void LocalBroker::addListener(std::shared_ptr<IListener> listener) {
    if (!listener) {
        throw core::BindError("cannot add a null listener");
    }

    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        auto it = std::find_if(listeners_.begin(), listeners_.end(),
                               [&](const ServedListener& served) {
                                   return served.listener->id() == listener->id();
                               });
        if (it != listeners_.end()) {
            throw core::BindError("listener id already exists: " + listener->id());
        }
    }

    try {
        listener->init(logger_);
    } catch (const core::MqttdException&) {
        throw;
    } catch (const std::exception& e) {
        throw core::InitError("failed to initialize listener " + listener->id() + ": " + e.what());
    }

    std::lock_guard<std::mutex> lock(listenersMutex_);
    ServedListener served;
    served.listener = listener;
    listeners_.push_back(std::move(served));
    logger_->info("Attached listener {} ({}) on {}", listener->id(), listener->protocol(),
                  listener->address());
}

void LocalBroker::serve() {
    if (closed_) {
        logger_->warn("Broker host already closed, not serving");
        return;
    }

    std::lock_guard<std::mutex> lock(listenersMutex_);
    for (auto& served : listeners_) {
        if (served.thread.joinable() || served.done.valid()) {
            continue;
        }

        auto promise = std::make_shared<std::promise<void>>();
        served.done = promise->get_future();
        auto listener = served.listener;
        served.thread = std::thread([this, listener, promise]() {
            try {
                listener->serve([this](const std::string& listenerId, std::shared_ptr<Connection> connection) {
                    handleConnection(listenerId, std::move(connection));
                });
            } catch (const std::exception& e) {
                logger_->error("Listener {} stopped serving: {}", listener->id(), e.what());
            }
            promise->set_value();
        });
    }

    serving_ = true;
    logger_->info("Broker host serving {} listener(s)", listeners_.size());
}

void LocalBroker::close() {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true)) {
        return;
    }

    std::vector<ServedListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners.swap(listeners_);
    }

    for (auto& served : listeners) {
        served.listener->close([this](const std::string& listenerId) {
            closeListenerClients(listenerId);
        });

        if (!served.thread.joinable()) {
            continue;
        }

        if (served.done.wait_for(options_.listenerShutdownTimeout) == std::future_status::ready) {
            served.thread.join();
        } else {
            // The serve thread still references this object; it is only left
            // behind on the way out of the process.
            core::ShutdownError error("listener " + served.listener->id() + " did not stop within " +
                                      std::to_string(options_.listenerShutdownTimeout.count()) + " ms");
            logger_->warn("{}", error.what());
            served.thread.detach();
        }
    }

    serving_ = false;
    if (!listeners.empty()) {
        logger_->info("Broker host closed");
    }
}

bool LocalBroker::authenticate(const core::ClientIdentity& client, const std::string& password) {
    auto hooks = hookSnapshot();
    if (hooks.empty()) {
        logger_->warn("No auth hook attached, rejecting client {}", client.clientId);
        return false;
    }
    return hooks.front()->onConnectAuthenticate(client, password);
}

bool LocalBroker::checkAcl(const core::ClientIdentity& client, const std::string& topic, bool write) {
    auto hooks = hookSnapshot();
    if (hooks.empty()) {
        return false;
    }
    return hooks.front()->onAclCheck(client, topic, write);
}

std::vector<ClientSnapshot> LocalBroker::clients() const {
    std::lock_guard<std::mutex> lock(clientsMutex_);

    std::vector<ClientSnapshot> result;
    result.reserve(clients_.size());
    for (const auto& pair : clients_) {
        result.push_back(pair.second);
    }
    return result;
}

SystemInfo LocalBroker::info() const {
    SystemInfo info;
    auto now = std::chrono::system_clock::now();
    info.version = options_.version;
    info.started = std::chrono::duration_cast<std::chrono::seconds>(startTime_.time_since_epoch()).count();
    info.time = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    info.uptime = info.time - info.started;
    info.bytesReceived = bytesReceived_;
    info.bytesSent = bytesSent_;
    info.clientsTotal = clientsTotal_;
    info.clientsMaximum = clientsMaximum_;
    info.messagesReceived = messagesReceived_;
    info.messagesSent = messagesSent_;
    info.memoryResident = residentBytes();

    {
        std::lock_guard<std::mutex> lock(clientsMutex_);
        info.clientsConnected = static_cast<int64_t>(clients_.size());
        for (const auto& pair : clients_) {
            info.subscriptions += static_cast<int64_t>(pair.second.subscriptions.size());
        }
    }
    info.clientsDisconnected = std::max<int64_t>(0, info.clientsTotal - info.clientsConnected);

    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        info.threads = static_cast<int64_t>(listeners_.size());
    }
    return info;
}

void LocalBroker::setConnectionHandler(ConnectionHandler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    connectionHandler_ = std::move(handler);
}

bool LocalBroker::clientConnected(ClientSnapshot client) {
    std::lock_guard<std::mutex> lock(clientsMutex_);

    if (clients_.find(client.id) != clients_.end()) {
        logger_->warn("Client already connected: {}", client.id);
        return false;
    }

    logger_->info("Client connected: {} ({}) from {} via {}", client.id, client.username, client.remote,
                  client.listener);
    std::string id = client.id;
    clients_[id] = std::move(client);
    clientsTotal_++;

    int64_t connected = static_cast<int64_t>(clients_.size());
    if (connected > clientsMaximum_) {
        clientsMaximum_ = connected;
    }
    return true;
}

bool LocalBroker::clientDisconnected(const std::string& clientId) {
    std::lock_guard<std::mutex> lock(clientsMutex_);

    auto it = clients_.find(clientId);
    if (it == clients_.end()) {
        logger_->warn("Client not found for disconnection: {}", clientId);
        return false;
    }

    clients_.erase(it);
    logger_->info("Client disconnected: {}", clientId);
    return true;
}

bool LocalBroker::subscribe(const std::string& clientId, const std::string& filter, int qos) {
    std::lock_guard<std::mutex> lock(clientsMutex_);

    auto it = clients_.find(clientId);
    if (it == clients_.end()) {
        logger_->warn("Cannot subscribe - client not found: {}", clientId);
        return false;
    }

    it->second.subscriptions[filter] = qos;
    logger_->debug("Client {} subscribed to {} (QoS: {})", clientId, filter, qos);
    return true;
}

bool LocalBroker::unsubscribe(const std::string& clientId, const std::string& filter) {
    std::lock_guard<std::mutex> lock(clientsMutex_);

    auto it = clients_.find(clientId);
    if (it == clients_.end() || it->second.subscriptions.erase(filter) == 0) {
        logger_->warn("Subscription not found for unsubscribe: {} from {}", clientId, filter);
        return false;
    }

    logger_->debug("Client {} unsubscribed from {}", clientId, filter);
    return true;
}

void LocalBroker::recordTraffic(int64_t bytesReceived, int64_t bytesSent) {
    bytesReceived_ += bytesReceived;
    bytesSent_ += bytesSent;
}

void LocalBroker::recordMessage(bool received) {
    if (received) {
        messagesReceived_++;
    } else {
        messagesSent_++;
    }
}

void LocalBroker::closeListenerClients(const std::string& listenerId) {
    std::lock_guard<std::mutex> lock(clientsMutex_);

    size_t dropped = 0;
    for (auto it = clients_.begin(); it != clients_.end();) {
        if (it->second.listener == listenerId) {
            it = clients_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }

    if (dropped > 0) {
        logger_->info("Disconnected {} client(s) of listener {}", dropped, listenerId);
    }
}

size_t LocalBroker::listenerCount() const {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    return listeners_.size();
}

size_t LocalBroker::hookCount() const {
    std::lock_guard<std::mutex> lock(hooksMutex_);
    return hooks_.size();
}

void LocalBroker::handleConnection(const std::string& listenerId, std::shared_ptr<Connection> connection) {
    ConnectionHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlerMutex_);
        handler = connectionHandler_;
    }

    if (handler) {
        handler(listenerId, std::move(connection));
        return;
    }

    logger_->warn("No protocol engine attached, closing connection from {} on {}",
                  connection->remoteAddress(), listenerId);
    connection->close();
}

std::vector<std::shared_ptr<IHook>> LocalBroker::hookSnapshot() const {
    std::lock_guard<std::mutex> lock(hooksMutex_);
    return hooks_;
}

} // namespace broker
} // namespace server
} // namespace mqttd
