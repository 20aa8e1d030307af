#include "mqttd/server/mqtt_server.h"
#include "mqttd/server/broker/local_broker.h"
#include "mqttd/server/infrastructure/address.h"
#include "mqttd/core/errors.h"
#include "mqttd/core/utils.h"
#include <spdlog/spdlog.h>

namespace mqttd {
namespace server {

namespace {
void normalizeOrDisable(std::string& address, const char* listener) {
    try {
        address = infrastructure::normalizeAddress(address);
    } catch (const core::ConfigError& e) {
        spdlog::warn("{} listener disabled: {}", listener, e.what());
        address.clear();
    }
}
} // namespace

void ServerOptions::ensureDefaults() {
    if (maxMessageExpirySeconds == 0) {
        maxMessageExpirySeconds = 60 * 60;
    }
    if (maxSessionExpirySeconds == 0) {
        maxSessionExpirySeconds = 60 * 6;
    }
    if (clientsBufferSize < 8192) {
        clientsBufferSize = 8192;
    }

    normalizeOrDisable(mqttAddress, "mqtt");
    normalizeOrDisable(tlsAddress, "mqtt+tls");
    normalizeOrDisable(wsAddress, "ws");
    normalizeOrDisable(webAddress, "web");

    if (!ledger) {
        disableAuth = true;
        ledger = std::make_shared<core::Ledger>();
    }
    if (!logger) {
        logger = spdlog::default_logger();
    }
}

std::string ServerOptions::listenerSummary() const {
    std::vector<std::string> parts;
    if (!mqttAddress.empty()) {
        parts.push_back("mqtt: " + mqttAddress);
    }
    if (!tlsAddress.empty()) {
        parts.push_back("mqtt+tls: " + tlsAddress);
    }
    if (!wsAddress.empty()) {
        parts.push_back("ws: " + wsAddress);
    }
    return core::string_utils::join(parts, "; ");
}

MqttServer::MqttServer(ServerOptions options)
    : MqttServer(std::move(options), nullptr, nullptr) {
}

MqttServer::MqttServer(ServerOptions options, std::shared_ptr<broker::IBroker> broker,
                       std::shared_ptr<IListenerFactory> factory)
    : options_(std::move(options)), broker_(std::move(broker)), factory_(std::move(factory)) {
    options_.ensureDefaults();
    logger_ = options_.logger;

    if (!broker_) {
        broker::LocalBrokerOptions brokerOptions;
        brokerOptions.clientsBufferSize = options_.clientsBufferSize;
        brokerOptions.maxMessageExpirySeconds = options_.maxMessageExpirySeconds;
        brokerOptions.maxSessionExpirySeconds = options_.maxSessionExpirySeconds;
        brokerOptions.inlineClient = options_.inlineClient;
        brokerOptions.logger = logger_;
        broker_ = std::make_shared<broker::LocalBroker>(brokerOptions);
    }
    if (!factory_) {
        factory_ = std::make_shared<DefaultListenerFactory>();
    }
}

MqttServer::~MqttServer() {
    stop();
}

bool MqttServer::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        logger_->warn("MQTT server already running");
        return true;
    }

    std::shared_ptr<broker::IHook> hook;
    if (options_.disableAuth) {
        logger_->warn("Authentication is disabled, every client is allowed");
        hook = std::make_shared<auth::AllowAllHook>();
    } else {
        ledgerHook_ = std::make_shared<auth::LedgerAuthHook>(options_.ledger);
        hook = ledgerHook_;
    }

    try {
        broker_->addHook(hook);
    } catch (const std::exception& e) {
        logger_->error("config auth error: {}", e.what());
        ledgerHook_.reset();
        return false;
    }

    auto tls = resolveTls();
    listenerIds_.clear();

    if (!options_.tlsAddress.empty()) {
        if (tls) {
            attachListener(factory_->createTcp({"mqtt+tls", options_.tlsAddress, tls}), "mqtt+tls");
        } else {
            logger_->warn("mqtt+tls listener disabled: no usable TLS material");
        }
    }

    if (!options_.mqttAddress.empty()) {
        attachListener(factory_->createTcp({"mqtt", options_.mqttAddress, nullptr}), "mqtt");
    }

    if (!options_.wsAddress.empty()) {
        attachListener(factory_->createWebSocket({"ws", options_.wsAddress, tls}), "ws");
    }

    if (!options_.webAddress.empty()) {
        protocols::http::ControlPlaneOptions web;
        web.listener = {"web", options_.webAddress, options_.secureWeb ? tls : nullptr};
        web.listenerSummary = options_.listenerSummary();
        if (!options_.disableAuth) {
            web.credentials = options_.ledger->credentials();
        }
        attachListener(factory_->createControlPlane(std::move(web), broker_.get()), "web");
    }

    try {
        broker_->serve();
    } catch (const std::exception& e) {
        logger_->error("serve error: {}", e.what());
        return false;
    }

    running_ = true;
    logger_->info("MQTT server started with {} listener(s)", listenerIds_.size());
    return true;
}

void MqttServer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (broker_) {
            broker_->close();
        }
        running_ = false;
    }
    stopped_.notify_all();
}

bool MqttServer::run() {
    if (!start()) {
        return false;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    stopped_.wait(lock, [this] { return !running_; });
    return true;
}

bool MqttServer::reloadLedger(std::shared_ptr<const core::Ledger> ledger) {
    if (!ledger) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!ledgerHook_) {
        logger_->warn("Ledger reload ignored: ledger auth is not active");
        return false;
    }

    ledgerHook_->swapLedger(ledger);
    logger_->info("Ledger reloaded: {} user(s)", ledger->userCount());
    return true;
}

std::vector<std::string> MqttServer::listenerIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listenerIds_;
}

bool MqttServer::attachListener(std::shared_ptr<broker::IListener> listener, const std::string& id) {
    if (!listener) {
        logger_->error("{} service error: listener could not be created", id);
        return false;
    }

    try {
        broker_->addListener(listener);
    } catch (const std::exception& e) {
        logger_->error("{} service error: {}", id, e.what());
        return false;
    }

    listenerIds_.push_back(id);
    return true;
}

std::shared_ptr<const infrastructure::TlsMaterial> MqttServer::resolveTls() {
    if (options_.tls) {
        return options_.tls;
    }

    if (options_.tlsAddress.empty() && options_.wsAddress.empty() && !options_.secureWeb) {
        return nullptr;
    }

    try {
        return infrastructure::loadTlsMaterial(options_.certFile, options_.keyFile, options_.rootCaFile);
    } catch (const core::ConfigError& e) {
        logger_->warn("{}", e.what());
        return nullptr;
    }
}

} // namespace server
} // namespace mqttd
