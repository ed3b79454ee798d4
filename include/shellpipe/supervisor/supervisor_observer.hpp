#pragma once
#include "shellpipe/core/failures.hpp"
#include "shellpipe/relay/session.hpp"
#include <string_view>
namespace shellpipe::channel::supervisor {

enum class ServerState {
    Idle,
    SpawningHost,
    WaitingForPeer,
    Connected,
    Teardown,
    Stopped
};

enum class ClientState {
    Connecting,
    Connected,
    Teardown,
    Terminal
};

std::string_view ToString(ServerState state) noexcept;
std::string_view ToString(ClientState state) noexcept;

/**
 * Lifecycle callbacks, invoked on the supervisor's thread.
 */
class ISupervisorObserver {
public:
    virtual ~ISupervisorObserver() = default;

    virtual void OnServerState(ServerState state) { (void)state; }
    virtual void OnClientState(ClientState state) { (void)state; }
    virtual void OnSessionEnded(const relay::SessionReport& report) { (void)report; }
    virtual void OnFailure(const ChannelFailure& failure) { (void)failure; }
};

/**
 * Renders lifecycle events as "[icon] message" status lines on stderr.
 */
class StatusLogObserver final : public ISupervisorObserver {
public:
    explicit StatusLogObserver(bool encrypted) noexcept : encrypted_(encrypted) {}

    void OnServerState(ServerState state) override;
    void OnClientState(ClientState state) override;
    void OnSessionEnded(const relay::SessionReport& report) override;
    void OnFailure(const ChannelFailure& failure) override;

private:
    bool encrypted_;
    bool client_ = false;
};
}
