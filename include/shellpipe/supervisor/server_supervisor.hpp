#pragma once
#include "shellpipe/core/result.hpp"
#include "shellpipe/core/failures.hpp"
#include "shellpipe/core/constants.hpp"
#include "shellpipe/codec/packet_codec.hpp"
#include "shellpipe/host/command_host.hpp"
#include "shellpipe/relay/session.hpp"
#include "shellpipe/supervisor/supervisor_observer.hpp"
#include "shellpipe/transport/channel.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
namespace shellpipe::channel::supervisor {

struct ServerSupervisorOptions {
    relay::SessionOptions session;
    std::chrono::milliseconds poll_interval = RelayConstants::POLL_INTERVAL;
    // 0 serves peers until RequestStop().
    uint32_t max_sessions = 0;
};

/**
 * Long-running server loop serving one peer at a time:
 *
 *   Idle -> SpawningHost -> WaitingForPeer -> Connected -> Teardown -> Idle
 *
 * A host that cannot be spawned ends Run() with the HostSpawn failure.
 * A failed accept terminates the fresh host and starts over. While
 * connected, liveness is sampled every poll interval.
 *
 * A null codec runs the channel in plain mode.
 */
class ServerSupervisor {
public:
    ServerSupervisor(
        std::shared_ptr<host::IHostLauncher> launcher,
        std::shared_ptr<transport::IChannelAcceptor> acceptor,
        std::shared_ptr<const codec::PacketCodec> codec,
        ServerSupervisorOptions options = {},
        ISupervisorObserver* observer = nullptr);

    ServerSupervisor(const ServerSupervisor&) = delete;
    ServerSupervisor& operator=(const ServerSupervisor&) = delete;

    /**
     * @return Ok after RequestStop() or max_sessions, HostSpawn failure
     *         otherwise. An exception raised while serving, such as a relay
     *         thread that cannot be started, ends the loop as a Generic failure.
     */
    [[nodiscard]] Result<Unit, ChannelFailure> Run();

    /**
     * Ends Run() at the next state boundary. Thread-safe.
     */
    void RequestStop() noexcept;

    [[nodiscard]] ServerState State() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t CompletedSessions() const noexcept {
        return completed_sessions_.load(std::memory_order_acquire);
    }

private:
    void Transition(ServerState state);
    [[nodiscard]] bool StopRequested() const noexcept {
        return stop_requested_.load(std::memory_order_acquire);
    }
    // Sleeps up to `interval`, returns early with true once a stop is requested.
    bool WaitForStop(std::chrono::milliseconds interval);
    relay::SessionEndReason Supervise(relay::Session& session);
    Result<Unit, ChannelFailure> Serve();

    std::shared_ptr<host::IHostLauncher> launcher_;
    std::shared_ptr<transport::IChannelAcceptor> acceptor_;
    std::shared_ptr<const codec::PacketCodec> codec_;
    ServerSupervisorOptions options_;
    ISupervisorObserver* observer_;

    std::atomic<ServerState> state_{ServerState::Idle};
    std::atomic<bool> stop_requested_{false};
    std::atomic<uint32_t> completed_sessions_{0};
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
};
}
