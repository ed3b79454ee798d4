#include "shellpipe/relay/pump.hpp"
#include "shellpipe/core/format.hpp"
#include <algorithm>
#include <ostream>
#include <vector>
namespace shellpipe::channel::relay {
namespace {
    class ActiveFlagClearer {
    public:
        explicit ActiveFlagClearer(std::atomic<bool>& active) noexcept : active_(active) {}
        ~ActiveFlagClearer() { active_.store(false, std::memory_order_release); }

        ActiveFlagClearer(const ActiveFlagClearer&) = delete;
        ActiveFlagClearer& operator=(const ActiveFlagClearer&) = delete;
    private:
        std::atomic<bool>& active_;
    };

    PumpReport Finish(PumpReport report, const PumpExitReason reason,
                      std::optional<ChannelFailure> failure = std::nullopt) {
        report.reason = reason;
        report.failure = std::move(failure);
        return report;
    }

    PumpReport FromException(const std::exception& ex) {
        PumpReport report;
        report.reason = PumpExitReason::Exception;
        report.failure = ChannelFailure::Generic(
            compat::format("Pump terminated by exception: {}", ex.what()));
        return report;
    }
}

std::string_view ToString(const PumpExitReason reason) noexcept {
    switch (reason) {
        case PumpExitReason::HostEof: return "HostEof";
        case PumpExitReason::HostFailure: return "HostFailure";
        case PumpExitReason::InputEof: return "InputEof";
        case PumpExitReason::TransportEof: return "TransportEof";
        case PumpExitReason::TransportFailure: return "TransportFailure";
        case PumpExitReason::SinkFailure: return "SinkFailure";
        case PumpExitReason::CodecFailure: return "CodecFailure";
        case PumpExitReason::Exception: return "Exception";
    }
    return "Unknown";
}

Result<Unit, ChannelFailure> HostInputSink::Deliver(std::span<const uint8_t> data) {
    return host_.WriteInput(data);
}

Result<Unit, ChannelFailure> StreamSink::Deliver(std::span<const uint8_t> data) {
    stream_.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
    stream_.flush();
    if (!stream_) {
        return Result<Unit, ChannelFailure>::Err(
            ChannelFailure::HostIo("Local output stream rejected the write"));
    }
    return Result<Unit, ChannelFailure>::Ok(unit);
}

Result<Unit, ChannelFailure> RecordWriter::Send(std::span<const uint8_t> payload) {
    if (codec_ == nullptr) {
        return channel_.Write(payload);
    }
    auto encrypt_result = codec_->Encrypt(payload);
    SPP_TRY(encrypt_result);
    std::string line = std::move(encrypt_result).Unwrap();
    line.push_back(RelayConstants::RECORD_DELIMITER);
    return channel_.Write(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(line.data()), line.size()));
}

// ============================================================================
// OutboundPump
// ============================================================================

OutboundPump::OutboundPump(
    host::ICommandHost& host,
    transport::IChannel& channel,
    const codec::PacketCodec* codec,
    std::atomic<bool>& active,
    const size_t unit_bytes) noexcept
    : host_(host)
    , writer_(channel, codec)
    , active_(active)
    , unit_bytes_(std::clamp<size_t>(unit_bytes, 1, RelayConstants::MAX_UNIT_BYTES)) {
}

PumpReport OutboundPump::Run() noexcept {
    ActiveFlagClearer clear_on_exit(active_);
    try {
        return Pump();
    } catch (const std::exception& ex) {
        return FromException(ex);
    }
}

PumpReport OutboundPump::Pump() {
    PumpReport report;
    std::vector<uint8_t> unit(unit_bytes_);
    while (true) {
        auto read_result = host_.ReadOutput(unit);
        if (read_result.IsErr()) {
            return Finish(std::move(report), PumpExitReason::HostFailure,
                          std::move(read_result).UnwrapErr());
        }
        const size_t count = read_result.Unwrap();
        if (count == 0) {
            return Finish(std::move(report), PumpExitReason::HostEof);
        }
        auto send_result = writer_.Send(std::span<const uint8_t>(unit.data(), count));
        if (send_result.IsErr()) {
            auto failure = std::move(send_result).UnwrapErr();
            const auto reason = failure.type == ChannelFailureType::Transport
                ? PumpExitReason::TransportFailure
                : PumpExitReason::CodecFailure;
            return Finish(std::move(report), reason, std::move(failure));
        }
        ++report.units;
        report.bytes += count;
    }
}

// ============================================================================
// InboundPump
// ============================================================================

InboundPump::InboundPump(
    transport::IChannel& channel,
    IByteSink& sink,
    const codec::PacketCodec* codec,
    std::atomic<bool>& active,
    const debug::Role role) noexcept
    : channel_(channel)
    , sink_(sink)
    , codec_(codec)
    , active_(active)
    , role_(role) {
}

PumpReport InboundPump::Run() noexcept {
    ActiveFlagClearer clear_on_exit(active_);
    try {
        return codec_ != nullptr ? PumpRecords() : PumpRaw();
    } catch (const std::exception& ex) {
        return FromException(ex);
    }
}

PumpReport InboundPump::PumpRecords() {
    PumpReport report;
    while (true) {
        auto line_result = channel_.ReadLine();
        if (line_result.IsErr()) {
            if (line_result.UnwrapErr().IsCryptoUnitFailure()) {
                ++report.dropped;
                SPP_TRACE(role_, "inbound", "dropped record ({})", line_result.UnwrapErr().message);
                continue;
            }
            return Finish(std::move(report), PumpExitReason::TransportFailure,
                          std::move(line_result).UnwrapErr());
        }
        auto line = std::move(line_result).Unwrap();
        if (!line.has_value()) {
            SPP_TRACE(role_, "inbound", "end of stream after {} records, {} dropped",
                      report.units, report.dropped);
            return Finish(std::move(report), PumpExitReason::TransportEof);
        }
        auto payload_result = codec_->Decrypt(*line);
        if (payload_result.IsErr()) {
            const auto& failure = payload_result.UnwrapErr();
            if (!failure.IsCryptoUnitFailure()) {
                return Finish(std::move(report), PumpExitReason::CodecFailure,
                              std::move(payload_result).UnwrapErr());
            }
            ++report.dropped;
            SPP_TRACE(role_, "inbound", "dropped record of {} bytes ({})",
                      line->size(), ToString(failure.type));
            continue;
        }
        const auto payload = std::move(payload_result).Unwrap();
        auto deliver_result = sink_.Deliver(payload);
        if (deliver_result.IsErr()) {
            return Finish(std::move(report), PumpExitReason::SinkFailure,
                          std::move(deliver_result).UnwrapErr());
        }
        ++report.units;
        report.bytes += payload.size();
    }
}

PumpReport InboundPump::PumpRaw() {
    PumpReport report;
    std::vector<uint8_t> buffer(RelayConstants::READ_BUFFER_SIZE);
    while (true) {
        auto read_result = channel_.Read(buffer);
        if (read_result.IsErr()) {
            return Finish(std::move(report), PumpExitReason::TransportFailure,
                          std::move(read_result).UnwrapErr());
        }
        const size_t count = read_result.Unwrap();
        if (count == 0) {
            return Finish(std::move(report), PumpExitReason::TransportEof);
        }
        auto deliver_result = sink_.Deliver(std::span<const uint8_t>(buffer.data(), count));
        if (deliver_result.IsErr()) {
            return Finish(std::move(report), PumpExitReason::SinkFailure,
                          std::move(deliver_result).UnwrapErr());
        }
        ++report.units;
        report.bytes += count;
    }
}
}
