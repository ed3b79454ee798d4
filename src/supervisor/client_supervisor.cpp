#include "shellpipe/supervisor/client_supervisor.hpp"
#include "shellpipe/relay/pump.hpp"
#include "shellpipe/core/format.hpp"
#include <cctype>
#include <future>
#include <istream>
#include <thread>
namespace shellpipe::channel::supervisor {
namespace {
    // Closes both channels on scope exit so a blocked inbound pump returns.
    class CloseOnExit {
    public:
        explicit CloseOnExit(transport::ChannelPair& channels) noexcept : channels_(channels) {}
        ~CloseOnExit() { channels_.Close(); }

        CloseOnExit(const CloseOnExit&) = delete;
        CloseOnExit& operator=(const CloseOnExit&) = delete;
    private:
        transport::ChannelPair& channels_;
    };
}

ClientSupervisor::ClientSupervisor(
    std::shared_ptr<transport::IChannelConnector> connector,
    std::shared_ptr<const codec::PacketCodec> codec,
    std::istream& input,
    std::ostream& output,
    ClientSupervisorOptions options,
    ISupervisorObserver* observer)
    : connector_(std::move(connector))
    , codec_(std::move(codec))
    , input_(input)
    , output_(output)
    , options_(options)
    , observer_(observer) {
}

void ClientSupervisor::Transition(const ClientState state) {
    state_.store(state, std::memory_order_release);
    if (observer_) {
        observer_->OnClientState(state);
    }
}

bool ClientSupervisor::IsExitCommand(std::string_view line) noexcept {
    constexpr std::string_view command = "exit";
    if (line.size() != command.size()) {
        return false;
    }
    for (size_t i = 0; i < command.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(line[i])) != command[i]) {
            return false;
        }
    }
    return true;
}

std::string ClientSupervisor::Trim(std::string_view line) {
    const auto is_space = [](const char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    };
    while (!line.empty() && is_space(line.front())) {
        line.remove_prefix(1);
    }
    while (!line.empty() && is_space(line.back())) {
        line.remove_suffix(1);
    }
    return std::string(line);
}

Result<relay::SessionReport, ChannelFailure> ClientSupervisor::Run() {
    try {
        return RunSession();
    } catch (const std::exception& ex) {
        auto failure = ChannelFailure::Generic(
            compat::format("Client session aborted: {}", ex.what()));
        if (observer_) {
            observer_->OnFailure(failure);
        }
        Transition(ClientState::Terminal);
        return Result<relay::SessionReport, ChannelFailure>::Err(std::move(failure));
    }
}

Result<relay::SessionReport, ChannelFailure> ClientSupervisor::RunSession() {
    using RunResult = Result<relay::SessionReport, ChannelFailure>;
    Transition(ClientState::Connecting);
    auto connect_result = connector_->ConnectPair();
    if (connect_result.IsErr()) {
        auto failure = std::move(connect_result).UnwrapErr();
        if (observer_) {
            observer_->OnFailure(failure);
        }
        Transition(ClientState::Terminal);
        return RunResult::Err(std::move(failure));
    }
    transport::ChannelPair channels = std::move(connect_result).Unwrap();
    Transition(ClientState::Connected);

    std::atomic<bool> active{true};
    relay::StreamSink sink(output_);
    auto inbound = std::async(std::launch::async, [&] {
        relay::InboundPump pump(*channels.output, sink, codec_.get(), active, debug::Role::Client);
        return pump.Run();
    });
    CloseOnExit close_on_exit(channels);

    relay::RecordWriter writer(*channels.input, codec_.get());
    relay::PumpReport outbound;
    relay::SessionEndReason end_reason = relay::SessionEndReason::PumpStopped;
    std::string line;
    while (true) {
        if (!active.load(std::memory_order_acquire) || !channels.output->IsConnected()) {
            outbound.reason = relay::PumpExitReason::TransportEof;
            end_reason = relay::SessionEndReason::PeerDisconnected;
            break;
        }
        if (!std::getline(input_, line)) {
            outbound.reason = relay::PumpExitReason::InputEof;
            end_reason = relay::SessionEndReason::LocalInputClosed;
            break;
        }
        const std::string command = Trim(line);
        if (!active.load(std::memory_order_acquire) || !channels.IsConnected()) {
            outbound.reason = relay::PumpExitReason::TransportEof;
            end_reason = relay::SessionEndReason::PeerDisconnected;
            break;
        }
        std::string record = command;
        record.push_back(RelayConstants::RECORD_DELIMITER);
        auto send_result = writer.Send(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(record.data()), record.size()));
        if (send_result.IsErr()) {
            auto failure = std::move(send_result).UnwrapErr();
            outbound.reason = failure.type == ChannelFailureType::Transport
                ? relay::PumpExitReason::TransportFailure
                : relay::PumpExitReason::CodecFailure;
            outbound.failure = std::move(failure);
            end_reason = relay::SessionEndReason::PeerDisconnected;
            break;
        }
        ++outbound.units;
        outbound.bytes += record.size();
        if (IsExitCommand(command)) {
            std::this_thread::sleep_for(options_.exit_grace);
            outbound.reason = relay::PumpExitReason::InputEof;
            end_reason = relay::SessionEndReason::ExitCommand;
            break;
        }
    }

    Transition(ClientState::Teardown);
    channels.Close();
    relay::SessionReport report;
    report.end_reason = end_reason;
    report.outbound = std::move(outbound);
    report.inbound = inbound.get();
    if (observer_) {
        observer_->OnSessionEnded(report);
    }
    Transition(ClientState::Terminal);
    return RunResult::Ok(std::move(report));
}
}
