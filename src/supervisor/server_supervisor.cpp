#include "shellpipe/supervisor/server_supervisor.hpp"
#include "shellpipe/core/format.hpp"
namespace shellpipe::channel::supervisor {

ServerSupervisor::ServerSupervisor(
    std::shared_ptr<host::IHostLauncher> launcher,
    std::shared_ptr<transport::IChannelAcceptor> acceptor,
    std::shared_ptr<const codec::PacketCodec> codec,
    ServerSupervisorOptions options,
    ISupervisorObserver* observer)
    : launcher_(std::move(launcher))
    , acceptor_(std::move(acceptor))
    , codec_(std::move(codec))
    , options_(options)
    , observer_(observer) {
}

void ServerSupervisor::Transition(const ServerState state) {
    state_.store(state, std::memory_order_release);
    if (observer_) {
        observer_->OnServerState(state);
    }
}

void ServerSupervisor::RequestStop() noexcept {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_.store(true, std::memory_order_release);
    }
    stop_cv_.notify_all();
    acceptor_->Interrupt();
}

bool ServerSupervisor::WaitForStop(const std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return stop_cv_.wait_for(lock, interval, [this] { return StopRequested(); });
}

relay::SessionEndReason ServerSupervisor::Supervise(relay::Session& session) {
    while (true) {
        if (auto reason = session.Liveness()) {
            return *reason;
        }
        if (WaitForStop(options_.poll_interval)) {
            return relay::SessionEndReason::StopRequested;
        }
    }
}

Result<Unit, ChannelFailure> ServerSupervisor::Run() {
    try {
        return Serve();
    } catch (const std::exception& ex) {
        auto failure = ChannelFailure::Generic(
            compat::format("Server loop aborted: {}", ex.what()));
        if (observer_) {
            observer_->OnFailure(failure);
        }
        Transition(ServerState::Stopped);
        return Result<Unit, ChannelFailure>::Err(std::move(failure));
    }
}

Result<Unit, ChannelFailure> ServerSupervisor::Serve() {
    while (!StopRequested()) {
        Transition(ServerState::SpawningHost);
        auto launch_result = launcher_->Launch();
        if (launch_result.IsErr()) {
            auto failure = std::move(launch_result).UnwrapErr();
            if (observer_) {
                observer_->OnFailure(failure);
            }
            Transition(ServerState::Stopped);
            return Result<Unit, ChannelFailure>::Err(std::move(failure));
        }
        auto host = std::move(launch_result).Unwrap();

        Transition(ServerState::WaitingForPeer);
        auto accept_result = acceptor_->AcceptPair();
        if (accept_result.IsErr()) {
            host->Terminate();
            if (StopRequested()) {
                break;
            }
            if (observer_) {
                observer_->OnFailure(accept_result.UnwrapErr());
            }
            Transition(ServerState::Idle);
            WaitForStop(options_.poll_interval);
            continue;
        }

        Transition(ServerState::Connected);
        relay::Session session(
            std::move(accept_result).Unwrap(), std::move(host), codec_, options_.session);
        session.Start();
        const auto end_reason = Supervise(session);

        Transition(ServerState::Teardown);
        const auto report = session.Teardown(end_reason);
        const uint32_t completed = completed_sessions_.fetch_add(1, std::memory_order_acq_rel) + 1;
        if (observer_) {
            observer_->OnSessionEnded(report);
        }
        if (options_.max_sessions != 0 && completed >= options_.max_sessions) {
            break;
        }
        Transition(ServerState::Idle);
    }
    Transition(ServerState::Stopped);
    return Result<Unit, ChannelFailure>::Ok(unit);
}
}
