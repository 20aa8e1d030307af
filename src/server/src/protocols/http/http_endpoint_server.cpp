#include "mqttd/server/protocols/http/http_endpoint_server.h"
#include "mqttd/core/utils.h"

namespace mqttd {
namespace server {
namespace protocols {
namespace http {

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(core::string_utils::toLower(name));
    return it == headers.end() ? std::string() : it->second;
}

} // namespace http
} // namespace protocols
} // namespace server
} // namespace mqttd
