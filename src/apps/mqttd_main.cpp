#include <mqttd/core/errors.h>
#include <mqttd/core/ledger_builder.h>
#include <mqttd/core/obfuscation.h>
#include <mqttd/server/infrastructure/logging.h>
#include <mqttd/server/infrastructure/server_settings.h>
#include <mqttd/server/mqtt_server.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace mqttd;
using namespace mqttd::server;

namespace {

const char* MQTTD_VERSION = "1.0.0";
const char* DEFAULT_CONFIG = "mqttd.conf";
const char* SAMPLE_AUTH_FILE = "auth.yaml";

std::atomic<bool> running{true};
std::atomic<bool> reloadRequested{false};

void signalHandler(int signum) {
    if (signum == SIGHUP) {
        reloadRequested = true;
    } else {
        running = false;
    }
}

void showHelp() {
    std::cout << "mqttd - MQTT broker with a YAML access ledger and HTTP status pages" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: mqttd [options] [command]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "--config <path>       Configuration file (default: " << DEFAULT_CONFIG << ")" << std::endl;
    std::cout << "--auth <path>         YAML access file" << std::endl;
    std::cout << "--coded-pwd           Passwords in the access file are obfuscated" << std::endl;
    std::cout << "--disable-auth        Allow every client, ignore --auth" << std::endl;
    std::cout << "--log2file <path>     Also log to a daily rotating file" << std::endl;
    std::cout << "--log-level <level>   trace/debug/info/warn/error/critical (overrides the config)" << std::endl;
    std::cout << "--version             Show version information" << std::endl;
    std::cout << "--help                Show this help information" << std::endl;
    std::cout << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "initauth              Write a sample " << SAMPLE_AUTH_FILE << std::endl;
    std::cout << "code-password         Read a password from stdin and print its obfuscated form" << std::endl;
}

int initAuth() {
    try {
        core::LedgerBuilder::writeSample(SAMPLE_AUTH_FILE);
        std::cout << "Sample access file written to " << SAMPLE_AUTH_FILE << std::endl;
        return 0;
    } catch (const core::MqttdException& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
}

int codePassword() {
    std::string password;
    std::cout << "Password: ";
    if (!std::getline(std::cin, password) || password.empty()) {
        std::cerr << "No password given" << std::endl;
        return 1;
    }
    std::cout << core::encodeObfuscated(password) << std::endl;
    return 0;
}

std::shared_ptr<const core::Ledger> buildLedger(const std::string& authFile, bool codedPassword) {
    auto ledger = std::make_shared<core::Ledger>();
    if (!authFile.empty()) {
        *ledger = core::LedgerBuilder::fromFile(authFile, codedPassword);
        core::LedgerBuilder::logShadowedRules(*ledger);
    }
    core::LedgerBuilder::applyBootstrap(*ledger, core::BootstrapCredential{});
    return ledger;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = DEFAULT_CONFIG;
    std::string authFile;
    std::string logFile;
    std::string logLevel;
    bool codedPassword = false;
    bool disableAuth = false;
    std::string command;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--auth" && i + 1 < argc) {
            authFile = argv[++i];
        } else if (arg == "--log2file" && i + 1 < argc) {
            logFile = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            logLevel = argv[++i];
        } else if (arg == "--coded-pwd") {
            codedPassword = true;
        } else if (arg == "--disable-auth") {
            disableAuth = true;
        } else if (arg == "--version") {
            std::cout << "mqttd " << MQTTD_VERSION << std::endl;
            return 0;
        } else if (arg == "--help" || arg == "-h") {
            showHelp();
            return 0;
        } else if (arg == "initauth" || arg == "code-password") {
            command = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            showHelp();
            return 1;
        }
    }

    if (command == "initauth") {
        return initAuth();
    }
    if (command == "code-password") {
        return codePassword();
    }

    auto settings = infrastructure::ServerSettings::loadFromFile(configPath);
    auto logger = infrastructure::setupLogging(logLevel.empty() ? settings.logLevel : logLevel, logFile);

    ServerOptions options;
    options.mqttAddress = settings.portMqtt;
    options.tlsAddress = settings.portTls;
    options.wsAddress = settings.portWs;
    options.webAddress = settings.portWeb;
    options.certFile = settings.tlsCertFile;
    options.keyFile = settings.tlsKeyFile;
    options.rootCaFile = settings.tlsCaFile;
    options.maxMessageExpirySeconds = settings.messageTimeout;
    options.clientsBufferSize = settings.bufferSize;
    options.disableAuth = disableAuth;
    options.logger = logger;

    if (!disableAuth) {
        try {
            options.ledger = buildLedger(authFile, codedPassword);
        } catch (const core::MqttdException& e) {
            spdlog::critical("Failed to load access file: {}", e.what());
            return 1;
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);

    MqttServer server(options);
    if (!server.start()) {
        spdlog::critical("MQTT server failed to start");
        return 1;
    }

    spdlog::info("mqttd {} started", MQTTD_VERSION);
    spdlog::info("  - listeners: {}", server.options().listenerSummary());
    spdlog::info("  - web: {}", server.options().webAddress.empty() ? "disabled" : server.options().webAddress);
    spdlog::info("  - auth: {}", server.options().disableAuth ? "disabled" : "enabled");

    while (running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        if (reloadRequested.exchange(false)) {
            if (disableAuth) {
                spdlog::warn("Received SIGHUP, but auth is disabled");
                continue;
            }
            try {
                server.reloadLedger(buildLedger(authFile, codedPassword));
            } catch (const core::MqttdException& e) {
                spdlog::error("Ledger reload failed, keeping the current ledger: {}", e.what());
            }
        }
    }

    spdlog::info("Shutting down...");
    server.stop();
    spdlog::info("mqttd stopped");
    return 0;
}
