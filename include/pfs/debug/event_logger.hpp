#pragma once

/**
 * @file event_logger.hpp
 * @brief Line-oriented diagnostics for protocol events.
 *
 * Only identifiers, counters and failure codes are ever passed to these macros. Key material
 * and plaintext never reach the log.
 *
 * Warnings are always written to stderr. Trace events are compiled in only when
 * PFS_DEBUG_EVENTS is defined (CMake: -DPFS_DEBUG_EVENTS=ON).
 */

#include "pfs/core/failures.hpp"

#include <fmt/core.h>

#include <cstdio>
#include <string_view>

namespace pfs::debug {

enum class Component {
    Ratchet,
    Store,
    Exchange,
    Sync,
    Negotiation,
    Cleanup,
    DeviceAuth,
    Conflict,
    Config
};

inline const char* ComponentToString(const Component component) {
    switch (component) {
        case Component::Ratchet: return "RATCHET";
        case Component::Store: return "STORE";
        case Component::Exchange: return "EXCHANGE";
        case Component::Sync: return "SYNC";
        case Component::Negotiation: return "NEGOTIATION";
        case Component::Cleanup: return "CLEANUP";
        case Component::DeviceAuth: return "DEVICE_AUTH";
        case Component::Conflict: return "CONFLICT";
        case Component::Config: return "CONFIG";
    }
    return "UNKNOWN";
}

inline void WriteLine(const char* level, const Component component, std::string_view text) {
    fmt::print(stderr, "[PFS-{}] {} {}\n", level, ComponentToString(component), text);
    std::fflush(stderr);
}

}

#define PFS_LOG_WARN(component, ...) \
    ::pfs::debug::WriteLine("WARN", component, ::fmt::format(__VA_ARGS__))

#define PFS_LOG_FAILURE(component, operation, failure) \
    PFS_LOG_WARN(component, "{} failed: {}", operation, \
        ::pfs::protocol::ErrorCode((failure).type))

#ifdef PFS_DEBUG_EVENTS

#define PFS_LOG_EVENT(component, ...) \
    ::pfs::debug::WriteLine("EVENT", component, ::fmt::format(__VA_ARGS__))

#else

#define PFS_LOG_EVENT(component, ...) do { } while (0)

#endif
