#include "shellpipe/relay/session.hpp"
#include "shellpipe/debug/status_log.hpp"
namespace shellpipe::channel::relay {

std::string_view ToString(const SessionEndReason reason) noexcept {
    switch (reason) {
        case SessionEndReason::PeerDisconnected: return "PeerDisconnected";
        case SessionEndReason::HostExited: return "HostExited";
        case SessionEndReason::PumpStopped: return "PumpStopped";
        case SessionEndReason::StopRequested: return "StopRequested";
        case SessionEndReason::ExitCommand: return "ExitCommand";
        case SessionEndReason::LocalInputClosed: return "LocalInputClosed";
    }
    return "Unknown";
}

Session::Session(
    transport::ChannelPair channels,
    std::unique_ptr<host::ICommandHost> host,
    std::shared_ptr<const codec::PacketCodec> codec,
    SessionOptions options)
    : channels_(std::move(channels))
    , host_(std::move(host))
    , codec_(std::move(codec))
    , options_(options)
    , host_sink_(*host_) {
}

Session::~Session() {
    if (!torn_down_) {
        Teardown(SessionEndReason::StopRequested);
    }
}

void Session::Start() {
    active_.store(true, std::memory_order_release);
    outbound_ = std::async(std::launch::async, [this] {
        OutboundPump pump(*host_, *channels_.output, codec_.get(), active_, options_.unit_bytes);
        return pump.Run();
    });
    inbound_ = std::async(std::launch::async, [this] {
        InboundPump pump(*channels_.input, host_sink_, codec_.get(), active_, debug::Role::Server);
        return pump.Run();
    });
}

std::optional<SessionEndReason> Session::Liveness() {
    if (host_->HasExited()) {
        return SessionEndReason::HostExited;
    }
    if (!channels_.IsConnected()) {
        return SessionEndReason::PeerDisconnected;
    }
    if (!IsActive()) {
        return SessionEndReason::PumpStopped;
    }
    return std::nullopt;
}

SessionReport Session::Teardown(const SessionEndReason reason) {
    SessionReport report;
    report.end_reason = reason;
    if (torn_down_) {
        return report;
    }
    torn_down_ = true;
    host_->Terminate();
    channels_.Close();
    if (outbound_.valid()) {
        report.outbound = outbound_.get();
    }
    if (inbound_.valid()) {
        report.inbound = inbound_.get();
    }
    active_.store(false, std::memory_order_release);
    SPP_TRACE(debug::Role::Server, "session", "teardown ({}), outbound {} units, inbound {} units",
              ToString(reason),
              report.outbound ? report.outbound->units : 0,
              report.inbound ? report.inbound->units : 0);
    return report;
}
}
