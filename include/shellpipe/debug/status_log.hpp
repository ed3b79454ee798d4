#pragma once

/**
 * @file status_log.hpp
 * @brief Status and trace output for the relay and supervisors.
 *
 * Status lines are always written to stderr as "[icon] message", where the
 * icon tells the nature of the line:
 *   '*' progress, '+' success, '!' session ended / warning, 'x' error.
 *
 * Trace lines are compiled in only with -DSHELLPIPE_DEBUG_TRACE=ON. They
 * carry sizes and counters, never key material or decrypted payloads.
 */

#include "shellpipe/core/format.hpp"

#include <cstdio>
#include <string>
#include <string_view>

namespace shellpipe::debug {

enum class Role {
    Server,
    Client
};

inline const char* RoleToString(Role role) {
    switch (role) {
        case Role::Server: return "SERVER";
        case Role::Client: return "CLIENT";
    }
    return "UNKNOWN";
}

inline void WriteStatus(const char icon, std::string_view message) {
    fprintf(stderr, "[%c] %.*s\n", icon, static_cast<int>(message.size()), message.data());
    fflush(stderr);
}

#define SPP_STATUS(icon, ...) \
    ::shellpipe::debug::WriteStatus(icon, ::shellpipe::compat::format(__VA_ARGS__))

#ifdef SHELLPIPE_DEBUG_TRACE

#define SPP_TRACE(role, component, ...) \
    do { \
        fprintf(stderr, "[SPP-TRACE] %s %s %s\n", \
            ::shellpipe::debug::RoleToString(role), \
            component, \
            ::shellpipe::compat::format(__VA_ARGS__).c_str()); \
        fflush(stderr); \
    } while(0)

#else // !SHELLPIPE_DEBUG_TRACE

#define SPP_TRACE(role, component, ...) ((void)0)

#endif // SHELLPIPE_DEBUG_TRACE

} // namespace shellpipe::debug
