#pragma once
#include "shellpipe/core/result.hpp"
#include "shellpipe/core/failures.hpp"
#include "shellpipe/core/constants.hpp"
#include "shellpipe/codec/packet_codec.hpp"
#include "shellpipe/host/command_host.hpp"
#include "shellpipe/transport/channel.hpp"
#include "shellpipe/debug/status_log.hpp"
#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <span>
#include <string_view>
namespace shellpipe::channel::relay {

enum class PumpExitReason {
    HostEof,
    HostFailure,
    InputEof,
    TransportEof,
    TransportFailure,
    SinkFailure,
    CodecFailure,
    Exception
};

std::string_view ToString(PumpExitReason reason) noexcept;

/**
 * Outcome of one pump. `dropped` counts records that failed to decrypt or
 * decode and were discarded without output.
 */
struct PumpReport {
    PumpExitReason reason = PumpExitReason::Exception;
    std::optional<ChannelFailure> failure;
    uint64_t units = 0;
    uint64_t bytes = 0;
    uint64_t dropped = 0;
};

/**
 * Destination of the payloads an inbound pump recovers.
 */
class IByteSink {
public:
    virtual ~IByteSink() = default;

    [[nodiscard]] virtual Result<Unit, ChannelFailure> Deliver(std::span<const uint8_t> data) = 0;
};

class HostInputSink final : public IByteSink {
public:
    explicit HostInputSink(host::ICommandHost& host) noexcept : host_(host) {}

    [[nodiscard]] Result<Unit, ChannelFailure> Deliver(std::span<const uint8_t> data) override;

private:
    host::ICommandHost& host_;
};

/**
 * Writes payloads to a local stream and flushes after each one.
 */
class StreamSink final : public IByteSink {
public:
    explicit StreamSink(std::ostream& stream) noexcept : stream_(stream) {}

    [[nodiscard]] Result<Unit, ChannelFailure> Deliver(std::span<const uint8_t> data) override;

private:
    std::ostream& stream_;
};

/**
 * Frames payloads for the transport: one base64 bundle plus '\n' per
 * payload with a codec, the raw bytes without one.
 */
class RecordWriter {
public:
    RecordWriter(transport::IChannel& channel, const codec::PacketCodec* codec) noexcept
        : channel_(channel), codec_(codec) {}

    [[nodiscard]] Result<Unit, ChannelFailure> Send(std::span<const uint8_t> payload);

    [[nodiscard]] bool IsEncrypted() const noexcept { return codec_ != nullptr; }

private:
    transport::IChannel& channel_;
    const codec::PacketCodec* codec_;
};

/**
 * Host output to transport, `unit_bytes` at a time.
 */
class OutboundPump {
public:
    OutboundPump(
        host::ICommandHost& host,
        transport::IChannel& channel,
        const codec::PacketCodec* codec,
        std::atomic<bool>& active,
        size_t unit_bytes = RelayConstants::DEFAULT_UNIT_BYTES) noexcept;

    /**
     * Runs until the host output ends or the transport write fails, then
     * clears `active`.
     */
    [[nodiscard]] PumpReport Run() noexcept;

private:
    PumpReport Pump();

    host::ICommandHost& host_;
    RecordWriter writer_;
    std::atomic<bool>& active_;
    size_t unit_bytes_;
};

/**
 * Transport to sink. With a codec, records that fail authentication or
 * parsing are dropped and counted, and the pump keeps going.
 */
class InboundPump {
public:
    InboundPump(
        transport::IChannel& channel,
        IByteSink& sink,
        const codec::PacketCodec* codec,
        std::atomic<bool>& active,
        debug::Role role = debug::Role::Server) noexcept;

    [[nodiscard]] PumpReport Run() noexcept;

private:
    PumpReport PumpRecords();
    PumpReport PumpRaw();

    transport::IChannel& channel_;
    IByteSink& sink_;
    const codec::PacketCodec* codec_;
    std::atomic<bool>& active_;
    debug::Role role_;
};
}
