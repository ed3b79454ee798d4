#pragma once
#include "shellpipe/core/result.hpp"
#include "shellpipe/core/failures.hpp"
#include "shellpipe/core/constants.hpp"
#include "shellpipe/codec/packet_codec.hpp"
#include "shellpipe/relay/session.hpp"
#include "shellpipe/supervisor/supervisor_observer.hpp"
#include "shellpipe/transport/channel.hpp"
#include <atomic>
#include <chrono>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
namespace shellpipe::channel::supervisor {

struct ClientSupervisorOptions {
    std::chrono::milliseconds exit_grace = RelayConstants::EXIT_GRACE_DELAY;
};

/**
 * Single client session:
 *
 *   Connecting -> Connected -> Teardown -> Terminal
 *
 * Remote output is rendered to `output` by an inbound pump. The calling
 * thread reads `input` line by line, trims each line and sends it with a
 * trailing '\n'. Typing `exit` in any case waits the grace delay so the
 * remote host can act on it, then tears down. End of `input` ends the
 * session too.
 */
class ClientSupervisor {
public:
    ClientSupervisor(
        std::shared_ptr<transport::IChannelConnector> connector,
        std::shared_ptr<const codec::PacketCodec> codec,
        std::istream& input,
        std::ostream& output,
        ClientSupervisorOptions options = {},
        ISupervisorObserver* observer = nullptr);

    ClientSupervisor(const ClientSupervisor&) = delete;
    ClientSupervisor& operator=(const ClientSupervisor&) = delete;

    /**
     * @return The session report, the Transport failure of the connect, or
     *         a Generic failure when the session aborts with an exception
     */
    [[nodiscard]] Result<relay::SessionReport, ChannelFailure> Run();

    [[nodiscard]] ClientState State() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] static bool IsExitCommand(std::string_view line) noexcept;
    [[nodiscard]] static std::string Trim(std::string_view line);

private:
    void Transition(ClientState state);
    Result<relay::SessionReport, ChannelFailure> RunSession();

    std::shared_ptr<transport::IChannelConnector> connector_;
    std::shared_ptr<const codec::PacketCodec> codec_;
    std::istream& input_;
    std::ostream& output_;
    ClientSupervisorOptions options_;
    ISupervisorObserver* observer_;
    std::atomic<ClientState> state_{ClientState::Connecting};
};
}
