#pragma once

#include "shellpipe/core/constants.hpp"
#include "shellpipe/core/failures.hpp"
#include "shellpipe/core/result.hpp"
#include "shellpipe/host/command_host.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shellpipe::channel::configuration {

/// Which end of the channel this process is
enum class ChannelRole : uint8_t {
    /// Spawns the command host and serves peers one after another
    Server = 0,

    /// Connects to a server and drives its host from the local console
    Client = 1
};

/// Configuration of one ShellPipe process
///
/// A value type: build it with a factory, adjust fields, then call
/// Validate() before handing it to the supervisors.
///
/// @example
/// ```cpp
/// auto config = ChannelConfig::Client("10.0.0.5");
/// config.passphrase = "secret1";
/// if (auto valid = config.Validate(); valid.IsErr()) {
///     // report valid.UnwrapErr().message
/// }
/// ```
struct ChannelConfig {
    // =========================================================================
    // Factory Methods
    // =========================================================================

    [[nodiscard]] static ChannelConfig Server() {
        ChannelConfig config;
        config.role = ChannelRole::Server;
        return config;
    }

    [[nodiscard]] static ChannelConfig Client(std::string remote_host = std::string(TransportConstants::LOCAL_MACHINE)) {
        ChannelConfig config;
        config.role = ChannelRole::Client;
        config.remote_host = std::move(remote_host);
        return config;
    }

    // =========================================================================
    // Fields
    // =========================================================================

    ChannelRole role = ChannelRole::Server;

    /// Shared secret. Absent or empty runs the channel unencrypted.
    std::optional<std::string> passphrase;

    /// Server the client connects to
    std::string remote_host = std::string(TransportConstants::LOCAL_MACHINE);

    /// Address the server listens on
    std::string bind_address = "0.0.0.0";

    /// Output channel port; the input channel uses port + 1
    uint16_t port = TransportConstants::DEFAULT_PORT;

    /// Command host launched by the server. $SHELL is not consulted.
    std::string shell_path = std::string(HostConstants::DEFAULT_SHELL);
    std::vector<std::string> shell_args;

    /// Account for the command host (server only)
    host::HostIdentity identity;

    uint32_t kdf_iterations = Constants::KDF_DEFAULT_ITERATIONS;
    uint32_t padding_min = Constants::DECOY_MIN_BYTES;
    uint32_t padding_max = Constants::DECOY_MAX_BYTES;

    /// Host output bytes per outbound record
    size_t unit_bytes = RelayConstants::DEFAULT_UNIT_BYTES;

    std::chrono::milliseconds poll_interval = RelayConstants::POLL_INTERVAL;
    std::chrono::milliseconds exit_grace = RelayConstants::EXIT_GRACE_DELAY;

    /// Sessions served before the server stops; 0 = unlimited
    uint32_t max_sessions = 0;

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool IsEncrypted() const noexcept {
        return passphrase.has_value() && !passphrase->empty();
    }

    [[nodiscard]] bool IsServer() const noexcept { return role == ChannelRole::Server; }

    /// Check field ranges and role-specific constraints
    ///
    /// @return InvalidInput naming the first offending field
    [[nodiscard]] Result<Unit, ChannelFailure> Validate() const;
};

} // namespace shellpipe::channel::configuration
