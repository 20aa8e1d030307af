#include "mqttd/server/infrastructure/tls_material.h"
#include "mqttd/core/errors.h"
#include <boost/system/system_error.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace mqttd {
namespace server {
namespace infrastructure {

namespace {
void requireReadable(const std::string& path, const char* what) {
    if (path.empty()) {
        throw core::ConfigError(std::string("no TLS ") + what + " file configured");
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        throw core::ConfigError(std::string("cannot open TLS ") + what + " file: " + path);
    }
}
} // namespace

std::shared_ptr<TlsMaterial> loadTlsMaterial(const std::string& certFile,
                                             const std::string& keyFile,
                                             const std::string& caFile) {
    namespace ssl = boost::asio::ssl;

    requireReadable(certFile, "certificate");
    requireReadable(keyFile, "key");
    if (!caFile.empty()) {
        requireReadable(caFile, "CA");
    }

    auto material = std::make_shared<TlsMaterial>();
    material->certFile = certFile;
    material->keyFile = keyFile;
    material->caFile = caFile;

    try {
        material->context = std::make_shared<ssl::context>(ssl::context::tls_server);
        material->context->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                                       ssl::context::no_sslv3 | ssl::context::no_tlsv1 |
                                       ssl::context::no_tlsv1_1 | ssl::context::single_dh_use);
        material->context->use_certificate_chain_file(certFile);
        material->context->use_private_key_file(keyFile, ssl::context::pem);

        if (!caFile.empty()) {
            material->context->load_verify_file(caFile);
            material->context->set_verify_mode(ssl::verify_peer);
        }
    } catch (const boost::system::system_error& e) {
        throw core::ConfigError("failed to load TLS material (" + certFile + ", " + keyFile + "): " + e.what());
    }

    spdlog::debug("Loaded TLS material from {} / {}", certFile, keyFile);
    return material;
}

} // namespace infrastructure
} // namespace server
} // namespace mqttd
