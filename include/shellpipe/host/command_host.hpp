#pragma once
#include "shellpipe/core/result.hpp"
#include "shellpipe/core/failures.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
namespace shellpipe::channel::host {

/**
 * Account the command host runs under. An empty username means the
 * account of the current process.
 */
struct HostIdentity {
    std::string username;
    std::string password;
    std::string domain;

    [[nodiscard]] bool IsSet() const noexcept { return !username.empty(); }
};

/**
 * A running interactive command host with byte-stream input and output.
 *
 * ReadOutput and WriteInput block and are each called from a single pump.
 * HasExited and Terminate may be called from any thread.
 */
class ICommandHost {
public:
    virtual ~ICommandHost() = default;

    /**
     * @return Bytes read, 0 once the output stream reached its end
     */
    [[nodiscard]] virtual Result<size_t, ChannelFailure> ReadOutput(std::span<uint8_t> buffer) = 0;

    [[nodiscard]] virtual Result<Unit, ChannelFailure> WriteInput(std::span<const uint8_t> data) = 0;

    [[nodiscard]] virtual bool HasExited() = 0;

    /**
     * Force the host down and unblock a pending ReadOutput. Idempotent.
     */
    virtual void Terminate() noexcept = 0;
};

class IHostLauncher {
public:
    virtual ~IHostLauncher() = default;

    /**
     * @return HostSpawn failure when the host cannot be started
     */
    [[nodiscard]] virtual Result<std::unique_ptr<ICommandHost>, ChannelFailure> Launch() = 0;
};
}
