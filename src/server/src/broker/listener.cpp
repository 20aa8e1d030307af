#include "mqttd/server/broker/listener.h"

namespace mqttd {
namespace server {
namespace broker {

const char* toString(ListenerState state) {
    switch (state) {
        case ListenerState::CREATED: return "created";
        case ListenerState::INITIALIZED: return "initialized";
        case ListenerState::SERVING: return "serving";
        case ListenerState::CLOSED: return "closed";
    }
    return "unknown";
}

} // namespace broker
} // namespace server
} // namespace mqttd
