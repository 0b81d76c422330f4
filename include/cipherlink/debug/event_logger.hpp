#pragma once

/**
 * @file event_logger.hpp
 * @brief Debug tracing for key agreement, decryption and call negotiation.
 *
 * Only identifiers, states and sizes are traced; key material never is.
 * Enable via CMake: -DCIPHERLINK_DEBUG_EVENTS=ON
 */

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace cipherlink::debug {

enum class Component {
    Kdf,
    KeyExchange,
    Codec,
    Messaging,
    Registry,
    Negotiator,
    Relay
};

inline const char* ComponentToString(Component component) {
    switch (component) {
        case Component::Kdf: return "KDF";
        case Component::KeyExchange: return "KEYX";
        case Component::Codec: return "CODEC";
        case Component::Messaging: return "MSG";
        case Component::Registry: return "RTC";
        case Component::Negotiator: return "NEGO";
        case Component::Relay: return "RELAY";
    }
    return "UNKNOWN";
}

#ifdef CIPHERLINK_DEBUG_EVENTS

#define CIPHERLINK_LOG_EVENT(component, event, detail) \
    do { \
        fprintf(stderr, "[CIPHERLINK] %s %s: %s\n", \
            ::cipherlink::debug::ComponentToString(component), \
            event, \
            std::string(detail).c_str()); \
        fflush(stderr); \
    } while(0)

#define CIPHERLINK_LOG_PEER(component, event, peer_uuid, detail) \
    do { \
        fprintf(stderr, "[CIPHERLINK] %s %s [%.8s]: %s\n", \
            ::cipherlink::debug::ComponentToString(component), \
            event, \
            std::string(peer_uuid).c_str(), \
            std::string(detail).c_str()); \
        fflush(stderr); \
    } while(0)

#define CIPHERLINK_LOG_VALUE(component, event, name, value) \
    do { \
        fprintf(stderr, "[CIPHERLINK] %s %s %s=%s\n", \
            ::cipherlink::debug::ComponentToString(component), \
            event, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stderr); \
    } while(0)

#else // !CIPHERLINK_DEBUG_EVENTS

#define CIPHERLINK_LOG_EVENT(component, event, detail) ((void)0)
#define CIPHERLINK_LOG_PEER(component, event, peer_uuid, detail) ((void)0)
#define CIPHERLINK_LOG_VALUE(component, event, name, value) ((void)0)

#endif // CIPHERLINK_DEBUG_EVENTS

} // namespace cipherlink::debug
