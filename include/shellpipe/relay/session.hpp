#pragma once
#include "shellpipe/relay/pump.hpp"
#include "shellpipe/codec/packet_codec.hpp"
#include "shellpipe/host/command_host.hpp"
#include "shellpipe/transport/channel.hpp"
#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <string_view>
namespace shellpipe::channel::relay {

enum class SessionEndReason {
    PeerDisconnected,
    HostExited,
    PumpStopped,
    StopRequested,
    ExitCommand,
    LocalInputClosed
};

std::string_view ToString(SessionEndReason reason) noexcept;

struct SessionReport {
    SessionEndReason end_reason = SessionEndReason::PumpStopped;
    std::optional<PumpReport> outbound;
    std::optional<PumpReport> inbound;
};

struct SessionOptions {
    size_t unit_bytes = RelayConstants::DEFAULT_UNIT_BYTES;
};

/**
 * One connected peer on the server side: host output is pumped to
 * `channels.output`, `channels.input` is pumped into the host.
 *
 * Start() launches both pumps as async tasks. The owner polls Liveness()
 * and calls Teardown() once it reports an end reason. Teardown order:
 * terminate the host, close both channels, join both pumps.
 */
class Session {
public:
    Session(
        transport::ChannelPair channels,
        std::unique_ptr<host::ICommandHost> host,
        std::shared_ptr<const codec::PacketCodec> codec,
        SessionOptions options = {});

    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void Start();

    /**
     * @return Why the session should end, or std::nullopt while it is healthy
     */
    [[nodiscard]] std::optional<SessionEndReason> Liveness();

    SessionReport Teardown(SessionEndReason reason);

    [[nodiscard]] bool IsActive() const noexcept {
        return active_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool IsEncrypted() const noexcept { return codec_ != nullptr; }

private:
    transport::ChannelPair channels_;
    std::unique_ptr<host::ICommandHost> host_;
    std::shared_ptr<const codec::PacketCodec> codec_;
    SessionOptions options_;
    HostInputSink host_sink_;
    std::atomic<bool> active_{false};
    std::future<PumpReport> outbound_;
    std::future<PumpReport> inbound_;
    bool torn_down_ = false;
};
}
