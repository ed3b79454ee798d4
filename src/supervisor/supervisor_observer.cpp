#include "shellpipe/supervisor/supervisor_observer.hpp"
#include "shellpipe/debug/status_log.hpp"
namespace shellpipe::channel::supervisor {

std::string_view ToString(const ServerState state) noexcept {
    switch (state) {
        case ServerState::Idle: return "Idle";
        case ServerState::SpawningHost: return "SpawningHost";
        case ServerState::WaitingForPeer: return "WaitingForPeer";
        case ServerState::Connected: return "Connected";
        case ServerState::Teardown: return "Teardown";
        case ServerState::Stopped: return "Stopped";
    }
    return "Unknown";
}

std::string_view ToString(const ClientState state) noexcept {
    switch (state) {
        case ClientState::Connecting: return "Connecting";
        case ClientState::Connected: return "Connected";
        case ClientState::Teardown: return "Teardown";
        case ClientState::Terminal: return "Terminal";
    }
    return "Unknown";
}

void StatusLogObserver::OnServerState(const ServerState state) {
    switch (state) {
        case ServerState::WaitingForPeer:
            SPP_STATUS('*', "Waiting for peer...");
            break;
        case ServerState::Connected:
            SPP_STATUS('+', "Peer connected!");
            break;
        default:
            SPP_TRACE(debug::Role::Server, "supervisor", "state {}", ToString(state));
            break;
    }
}

void StatusLogObserver::OnClientState(const ClientState state) {
    client_ = true;
    switch (state) {
        case ClientState::Connecting:
            SPP_STATUS('*', "Establishing {} connection to remote system...",
                       encrypted_ ? "a secure" : "an unsecure");
            break;
        case ClientState::Connected:
            SPP_STATUS('+', "Successfully connected, spawning shell...");
            break;
        case ClientState::Terminal:
            SPP_STATUS('!', "Session with remote host is now terminated.");
            break;
        case ClientState::Teardown:
            break;
    }
}

void StatusLogObserver::OnSessionEnded(const relay::SessionReport& report) {
    if (!client_) {
        SPP_STATUS('!', "Peer disconnected!");
    }
    SPP_TRACE(client_ ? debug::Role::Client : debug::Role::Server, "supervisor",
              "session ended: {}", relay::ToString(report.end_reason));
    (void)report;
}

void StatusLogObserver::OnFailure(const ChannelFailure& failure) {
    SPP_STATUS('x', "{}: \"{}\"", ToString(failure.type), failure.message);
}
}
