#include <catch2/catch_test_macros.hpp>
#include "shellpipe/transport/tcp_channel.hpp"
#include "shellpipe/host/posix_command_host.hpp"
#include "shellpipe/supervisor/client_supervisor.hpp"
#include "shellpipe/supervisor/server_supervisor.hpp"
#include "shellpipe/crypto/sodium_interop.hpp"
#include <functional>
#include <future>
#include <sstream>
#include <thread>
#include <unistd.h>
using namespace shellpipe::channel;
using namespace shellpipe::channel::transport;
using namespace std::chrono_literals;
namespace {
    constexpr std::string_view LOOPBACK = "127.0.0.1";

    // Each listener takes two consecutive ports; search for a free pair.
    std::unique_ptr<TcpChannelAcceptor> ListenOnFreePort() {
        uint16_t port = static_cast<uint16_t>(41000 + (::getpid() % 1000) * 8);
        for (int attempt = 0; attempt < 64; ++attempt, port = static_cast<uint16_t>(port + 2)) {
            auto listening = TcpChannelAcceptor::Listen(LOOPBACK, port);
            if (listening.IsOk()) {
                return std::move(listening).Unwrap();
            }
        }
        FAIL("No free port pair on the loopback interface");
        return nullptr;
    }
    void SendText(IChannel& channel, const std::string& text) {
        REQUIRE(channel.Write(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(text.data()), text.size())).IsOk());
    }
    bool WaitUntil(const std::function<bool()>& predicate, const std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(10ms);
        }
        return predicate();
    }
}
TEST_CASE("TcpChannel - Loopback pair", "[transport][integration]") {
    auto acceptor = ListenOnFreePort();
    auto accepted = std::async(std::launch::async, [&acceptor] { return acceptor->AcceptPair(); });
    TcpChannelConnector connector(std::string(LOOPBACK), acceptor->Port());
    auto connected = connector.ConnectPair();
    REQUIRE(connected.IsOk());
    REQUIRE(accepted.wait_for(2s) == std::future_status::ready);
    auto server_result = accepted.get();
    REQUIRE(server_result.IsOk());
    ChannelPair server = std::move(server_result).Unwrap();
    ChannelPair client = std::move(connected).Unwrap();
    REQUIRE(server.IsConnected());
    REQUIRE(client.IsConnected());
    SECTION("Client input reaches the server input channel") {
        SendText(*client.input, "whoami\nid\n");
        REQUIRE(server.input->ReadLine().Unwrap() == std::optional<std::string>("whoami"));
        REQUIRE(server.input->ReadLine().Unwrap() == std::optional<std::string>("id"));
    }
    SECTION("Server output reaches the client output channel") {
        SendText(*server.output, "root\n");
        REQUIRE(client.output->ReadLine().Unwrap() == std::optional<std::string>("root"));
    }
    SECTION("Final unterminated line is returned before end of stream") {
        SendText(*server.output, "tail");
        server.output->Close();
        REQUIRE(client.output->ReadLine().Unwrap() == std::optional<std::string>("tail"));
        REQUIRE_FALSE(client.output->ReadLine().Unwrap().has_value());
    }
    SECTION("Oversized record is skipped and the stream continues") {
        std::string wire(Constants::MAX_BUNDLE_LINE_SIZE + 8192, 'A');
        wire += "\nVALIDLINE\n";
        auto sending = std::async(std::launch::async, [&client, &wire] {
            return client.input->Write(std::span<const uint8_t>(
                reinterpret_cast<const uint8_t*>(wire.data()), wire.size())).IsOk();
        });
        auto skipped = server.input->ReadLine();
        REQUIRE(skipped.IsErrAnd([](const ChannelFailure& f) {
            return f.type == ChannelFailureType::Decode;
        }));
        REQUIRE(server.input->ReadLine().Unwrap() == std::optional<std::string>("VALIDLINE"));
        REQUIRE(sending.get());
    }
    SECTION("Peer close is observed") {
        client.Close();
        REQUIRE(WaitUntil([&server] { return !server.IsConnected(); }, 2s));
        REQUIRE_FALSE(server.input->ReadLine().Unwrap().has_value());
    }
    SECTION("Close unblocks a pending read") {
        auto pending = std::async(std::launch::async, [&server] { return server.input->ReadLine(); });
        REQUIRE(pending.wait_for(100ms) == std::future_status::timeout);
        server.input->Close();
        REQUIRE(pending.wait_for(2s) == std::future_status::ready);
        auto line = pending.get();
        REQUIRE(line.IsOk());
        REQUIRE_FALSE(line.Unwrap().has_value());
        const std::string late = "late\n";
        REQUIRE(server.input->Write(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(late.data()), late.size())).IsErr());
    }
}
TEST_CASE("TcpChannelAcceptor - Listener control", "[transport][integration]") {
    SECTION("Interrupt unblocks a pending accept") {
        auto acceptor = ListenOnFreePort();
        auto accepted = std::async(std::launch::async, [&acceptor] { return acceptor->AcceptPair(); });
        REQUIRE(accepted.wait_for(100ms) == std::future_status::timeout);
        acceptor->Interrupt();
        REQUIRE(accepted.wait_for(2s) == std::future_status::ready);
        auto result = accepted.get();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ChannelFailureType::Transport);
    }
    SECTION("Ports without room for the input channel are rejected") {
        const auto is_invalid_input = [](const ChannelFailure& f) {
            return f.type == ChannelFailureType::InvalidInput;
        };
        REQUIRE(TcpChannelAcceptor::Listen(LOOPBACK, 0).IsErrAnd(is_invalid_input));
        REQUIRE(TcpChannelAcceptor::Listen(LOOPBACK, 65535).IsErrAnd(is_invalid_input));
    }
    SECTION("Port in use is a transport failure") {
        auto acceptor = ListenOnFreePort();
        auto again = TcpChannelAcceptor::Listen(LOOPBACK, acceptor->Port());
        REQUIRE(again.IsErr());
        REQUIRE(again.UnwrapErr().type == ChannelFailureType::Transport);
    }
    SECTION("Connecting without a server fails") {
        uint16_t port = 0;
        {
            auto acceptor = ListenOnFreePort();
            port = acceptor->Port();
        }
        TcpChannelConnector connector(std::string(LOOPBACK), port);
        auto result = connector.ConnectPair();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ChannelFailureType::Transport);
    }
}
TEST_CASE("Loopback - Encrypted shell session", "[supervisor][integration]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto codec = std::make_shared<const codec::PacketCodec>("secret1");
    std::shared_ptr<TcpChannelAcceptor> acceptor = ListenOnFreePort();
    const uint16_t port = acceptor->Port();
    auto launcher = std::make_shared<host::PosixHostLauncher>("/bin/cat");
    supervisor::ServerSupervisorOptions server_options;
    server_options.poll_interval = 20ms;
    server_options.max_sessions = 1;
    supervisor::ServerSupervisor server(launcher, acceptor, codec, server_options);
    auto serving = std::async(std::launch::async, [&server] { return server.Run(); });
    struct StopOnExit {
        supervisor::ServerSupervisor& server;
        ~StopOnExit() { server.RequestStop(); }
    } stop_on_exit{server};
    SECTION("Raw peer sees its command echoed through the host") {
        TcpChannelConnector connector(std::string(LOOPBACK), port);
        auto pair = connector.ConnectPair().Unwrap();
        SendText(*pair.input, codec->EncryptString("whoami\n").Unwrap() + "\n");
        std::string echoed;
        while (echoed.size() < 7) {
            auto line = pair.output->ReadLine().Unwrap();
            REQUIRE(line.has_value());
            echoed += codec->DecryptString(*line).Unwrap();
        }
        REQUIRE(echoed == "whoami\n");
        pair.Close();
        REQUIRE(serving.wait_for(5s) == std::future_status::ready);
        REQUIRE(serving.get().IsOk());
        REQUIRE(server.CompletedSessions() == 1);
    }
    SECTION("Client supervisor drives the remote host") {
        std::istringstream input("hello\nexit\n");
        std::ostringstream output;
        supervisor::ClientSupervisorOptions client_options;
        client_options.exit_grace = 500ms;
        supervisor::ClientSupervisor client(
            std::make_shared<TcpChannelConnector>(std::string(LOOPBACK), port),
            codec, input, output, client_options);
        auto result = client.Run();
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().end_reason == relay::SessionEndReason::ExitCommand);
        REQUIRE(output.str().find("hello\n") != std::string::npos);
        REQUIRE(serving.wait_for(5s) == std::future_status::ready);
        REQUIRE(serving.get().IsOk());
    }
}
