#include "options.hpp"
#include "shellpipe/codec/packet_codec.hpp"
#include "shellpipe/codec/padding_strategy.hpp"
#include "shellpipe/crypto/sodium_interop.hpp"
#include "shellpipe/debug/status_log.hpp"
#include "shellpipe/host/posix_command_host.hpp"
#include "shellpipe/supervisor/client_supervisor.hpp"
#include "shellpipe/supervisor/server_supervisor.hpp"
#include "shellpipe/transport/tcp_channel.hpp"

#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <string>
#include <thread>
#include <vector>

using namespace shellpipe::channel;
using shellpipe::app::ParseOptions;
using shellpipe::app::Usage;

namespace {

// ============================================================================
// Shutdown signals
// ============================================================================

/// Blocks SIGINT/SIGTERM/SIGUSR1 in every thread and waits for them on a
/// dedicated one, so the stop path runs outside a signal handler.
/// SIGUSR1 only releases the waiter once the server has finished.
class ShutdownSignalWaiter {
public:
    explicit ShutdownSignalWaiter(supervisor::ServerSupervisor& server) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        sigaddset(&signals_, SIGUSR1);
        pthread_sigmask(SIG_BLOCK, &signals_, nullptr);
        waiter_ = std::thread([this, &server] {
            int received = 0;
            if (sigwait(&signals_, &received) == 0 && received != SIGUSR1) {
                SPP_STATUS('!', "Shutdown signal received...");
                server.RequestStop();
            }
        });
    }

    ~ShutdownSignalWaiter() {
        pthread_kill(waiter_.native_handle(), SIGUSR1);
        waiter_.join();
    }

    ShutdownSignalWaiter(const ShutdownSignalWaiter&) = delete;
    ShutdownSignalWaiter& operator=(const ShutdownSignalWaiter&) = delete;

private:
    sigset_t signals_{};
    std::thread waiter_;
};

int RunServer(const configuration::ChannelConfig& config,
              std::shared_ptr<const codec::PacketCodec> codec,
              supervisor::ISupervisorObserver& observer) {
    auto listen_result = transport::TcpChannelAcceptor::Listen(config.bind_address, config.port);
    if (listen_result.IsErr()) {
        observer.OnFailure(listen_result.UnwrapErr());
        return 1;
    }
    std::shared_ptr<transport::IChannelAcceptor> acceptor = std::move(listen_result).Unwrap();
    auto launcher = std::make_shared<host::PosixHostLauncher>(
        config.shell_path, config.shell_args, config.identity);

    supervisor::ServerSupervisorOptions options;
    options.session.unit_bytes = config.unit_bytes;
    options.poll_interval = config.poll_interval;
    options.max_sessions = config.max_sessions;
    supervisor::ServerSupervisor server(
        std::move(launcher), std::move(acceptor), std::move(codec), options, &observer);

    ShutdownSignalWaiter shutdown(server);
    auto run_result = server.Run();
    return run_result.IsOk() ? 0 : 1;
}

int RunClient(const configuration::ChannelConfig& config,
              std::shared_ptr<const codec::PacketCodec> codec,
              supervisor::ISupervisorObserver& observer) {
    auto connector = std::make_shared<transport::TcpChannelConnector>(config.remote_host, config.port);
    supervisor::ClientSupervisorOptions options;
    options.exit_grace = config.exit_grace;
    supervisor::ClientSupervisor client(
        std::move(connector), std::move(codec), std::cin, std::cout, options, &observer);
    auto run_result = client.Run();
    return run_result.IsOk() ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "shellpipe";
    const std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    auto parse_result = ParseOptions(args);
    if (parse_result.IsErr()) {
        std::cerr << parse_result.UnwrapErr().message << "\n\n" << Usage(program);
        return 2;
    }
    const auto parsed = std::move(parse_result).Unwrap();
    if (parsed.show_help) {
        std::cout << Usage(program);
        return 0;
    }
    const auto& config = parsed.config;

    std::signal(SIGPIPE, SIG_IGN);

    supervisor::StatusLogObserver observer(config.IsEncrypted());

    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        observer.OnFailure(ChannelFailure::FromSodiumFailure(init.UnwrapErr()));
        return 1;
    }

    std::shared_ptr<const codec::PacketCodec> packet_codec;
    if (config.IsEncrypted()) {
        auto padding = codec::UniformRangePadding::Create(config.padding_min, config.padding_max);
        if (padding.IsErr()) {
            observer.OnFailure(padding.UnwrapErr());
            return 2;
        }
        codec::CodecOptions codec_options;
        codec_options.kdf_iterations = config.kdf_iterations;
        codec_options.padding = std::move(padding).Unwrap();
        packet_codec = std::make_shared<const codec::PacketCodec>(*config.passphrase, codec_options);
    }

    if (config.IsServer()) {
        return RunServer(config, std::move(packet_codec), observer);
    }
    return RunClient(config, std::move(packet_codec), observer);
}
