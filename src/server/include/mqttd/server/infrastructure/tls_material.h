#pragma once

#include <boost/asio/ssl/context.hpp>
#include <memory>
#include <string>

namespace mqttd {
namespace server {
namespace infrastructure {

/**
 * @brief Server TLS configuration shared by the TLS-capable listeners
 *
 * The file paths are kept next to the built context because the HTTP
 * server loads its certificate from files itself.
 */
struct TlsMaterial {
    std::string certFile;
    std::string keyFile;
    std::string caFile;
    std::shared_ptr<boost::asio::ssl::context> context;
};

/**
 * @brief Builds a TLS server context from PEM files
 *
 * When @p caFile is given, client certificates are requested and verified
 * against it, but not required.
 *
 * @throws ConfigError when a file is missing or does not load
 */
std::shared_ptr<TlsMaterial> loadTlsMaterial(const std::string& certFile,
                                             const std::string& keyFile,
                                             const std::string& caFile);

} // namespace infrastructure
} // namespace server
} // namespace mqttd
