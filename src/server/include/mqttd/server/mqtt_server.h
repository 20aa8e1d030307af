#pragma once

#include "mqttd/server/auth/ledger_auth_hook.h"
#include "mqttd/server/broker/broker.h"
#include "mqttd/server/infrastructure/tls_material.h"
#include "mqttd/server/listener_factory.h"
#include "mqttd/core/ledger.h"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mqttd {
namespace server {

/**
 * @brief Everything MqttServer needs to assemble a broker
 */
struct ServerOptions {
    // Listener addresses; empty disables the listener
    std::string mqttAddress;
    std::string tlsAddress;
    std::string wsAddress;
    std::string webAddress;

    // Used when tls is not supplied
    std::string certFile;
    std::string keyFile;
    std::string rootCaFile;
    std::shared_ptr<const infrastructure::TlsMaterial> tls;
    bool secureWeb = false; // serve the control plane over HTTPS

    std::shared_ptr<const core::Ledger> ledger; // null: auth disabled
    bool disableAuth = false;
    bool inlineClient = false;

    int maxMessageExpirySeconds = 0;
    int maxSessionExpirySeconds = 0;
    int clientsBufferSize = 0;

    std::shared_ptr<spdlog::logger> logger;

    /**
     * @brief Fills in defaults and normalizes the listener addresses
     *
     * Malformed addresses are logged and disable their listener.
     */
    void ensureDefaults();

    /**
     * @brief "mqtt: ...; mqtt+tls: ...; ws: ..." for the enabled listeners
     */
    std::string listenerSummary() const;
};

/**
 * @brief Assembles and runs the broker: auth hook, data-plane listeners
 *        and the control plane
 */
class MqttServer {
public:
    /**
     * @brief Uses a LocalBroker and the default listeners
     */
    explicit MqttServer(ServerOptions options);

    MqttServer(ServerOptions options, std::shared_ptr<broker::IBroker> broker,
               std::shared_ptr<IListenerFactory> factory);
    ~MqttServer();

    MqttServer(const MqttServer&) = delete;
    MqttServer& operator=(const MqttServer&) = delete;

    /**
     * @brief Registers the hook and listeners and starts serving
     *
     * @return false when the auth hook or broker serve fails; failing
     *         listeners are only logged and left out
     */
    bool start();

    void stop();

    /**
     * @brief start() and block until stop()
     */
    bool run();

    bool isRunning() const { return running_; }

    /**
     * @brief Swaps the ledger used for MQTT auth; the control-plane
     *        credentials keep their startup snapshot
     *
     * @return false when auth is disabled or the server is not started
     */
    bool reloadLedger(std::shared_ptr<const core::Ledger> ledger);

    const ServerOptions& options() const { return options_; }
    std::vector<std::string> listenerIds() const;
    std::shared_ptr<broker::IBroker> broker() const { return broker_; }

private:
    bool attachListener(std::shared_ptr<broker::IListener> listener, const std::string& id);
    std::shared_ptr<const infrastructure::TlsMaterial> resolveTls();

    ServerOptions options_;
    std::shared_ptr<broker::IBroker> broker_;
    std::shared_ptr<IListenerFactory> factory_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<auth::LedgerAuthHook> ledgerHook_;

    mutable std::mutex mutex_;
    std::condition_variable stopped_;
    std::vector<std::string> listenerIds_;
    std::atomic<bool> running_{false};
};

} // namespace server
} // namespace mqttd
