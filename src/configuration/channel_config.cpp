#include "shellpipe/configuration/channel_config.hpp"
#include "shellpipe/core/format.hpp"

namespace shellpipe::channel::configuration {

Result<Unit, ChannelFailure> ChannelConfig::Validate() const {
    using ValidateResult = Result<Unit, ChannelFailure>;
    if (port == 0 || port == UINT16_MAX) {
        return ValidateResult::Err(ChannelFailure::InvalidInput(compat::format(
            "port must be in 1..{}, got {}", UINT16_MAX - 1, port)));
    }
    if (kdf_iterations == 0) {
        return ValidateResult::Err(
            ChannelFailure::InvalidInput("kdf_iterations must be positive"));
    }
    if (padding_min > padding_max) {
        return ValidateResult::Err(ChannelFailure::InvalidInput(compat::format(
            "padding_min {} exceeds padding_max {}", padding_min, padding_max)));
    }
    if (unit_bytes == 0 || unit_bytes > RelayConstants::MAX_UNIT_BYTES) {
        return ValidateResult::Err(ChannelFailure::InvalidInput(compat::format(
            "unit_bytes must be in 1..{}, got {}", RelayConstants::MAX_UNIT_BYTES, unit_bytes)));
    }
    if (poll_interval.count() <= 0) {
        return ValidateResult::Err(
            ChannelFailure::InvalidInput("poll_interval must be positive"));
    }
    if (exit_grace.count() < 0) {
        return ValidateResult::Err(
            ChannelFailure::InvalidInput("exit_grace must not be negative"));
    }
    if (role == ChannelRole::Client) {
        if (remote_host.empty()) {
            return ValidateResult::Err(
                ChannelFailure::InvalidInput("remote_host must not be empty"));
        }
        if (identity.IsSet() || !identity.password.empty() || !identity.domain.empty()) {
            return ValidateResult::Err(ChannelFailure::InvalidInput(
                "account options apply to the server only"));
        }
    } else {
        if (shell_path.empty()) {
            return ValidateResult::Err(
                ChannelFailure::InvalidInput("shell_path must not be empty"));
        }
        if (!identity.IsSet() && (!identity.password.empty() || !identity.domain.empty())) {
            return ValidateResult::Err(ChannelFailure::InvalidInput(
                "password and domain require a username"));
        }
    }
    return ValidateResult::Ok(unit);
}

} // namespace shellpipe::channel::configuration
