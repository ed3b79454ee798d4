#include <catch2/catch_test_macros.hpp>
#include "shellpipe/relay/pump.hpp"
#include "shellpipe/crypto/sodium_interop.hpp"
#include "helpers/fake_channel.hpp"
#include "helpers/fake_command_host.hpp"
#include "shellpipe/transport/tcp_channel.hpp"
#include <future>
#include <sstream>
#include <sys/socket.h>
using namespace shellpipe::channel;
using namespace shellpipe::channel::relay;
using namespace shellpipe::channel::test_helpers;
using namespace std::chrono_literals;
namespace {
    std::vector<uint8_t> Bytes(std::string_view text) {
        return {text.begin(), text.end()};
    }
    class RecordingSink final : public IByteSink {
    public:
        Result<Unit, ChannelFailure> Deliver(std::span<const uint8_t> data) override {
            if (fail_) {
                return Result<Unit, ChannelFailure>::Err(ChannelFailure::HostIo("sink closed"));
            }
            received_.append(reinterpret_cast<const char*>(data.data()), data.size());
            ++deliveries_;
            return Result<Unit, ChannelFailure>::Ok(unit);
        }
        void Fail() { fail_ = true; }
        const std::string& Received() const { return received_; }
        int Deliveries() const { return deliveries_; }
    private:
        std::string received_;
        int deliveries_ = 0;
        bool fail_ = false;
    };
    std::vector<std::string> SplitLines(const std::string& text) {
        std::vector<std::string> lines;
        std::istringstream stream(text);
        std::string line;
        while (std::getline(stream, line)) {
            lines.push_back(line);
        }
        return lines;
    }
}
TEST_CASE("OutboundPump - Host output to transport", "[relay][pump]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto state = std::make_shared<FakeHostState>();
    FakeCommandHost host(state);
    auto link = MakeLink();
    std::atomic<bool> active{true};
    SECTION("Encrypted, one bundle per byte") {
        const codec::PacketCodec codec("secret1");
        state->output.Push("ok\n");
        state->Exit();
        OutboundPump pump(host, *link.near_end, &codec, active);
        const auto report = pump.Run();
        REQUIRE(report.reason == PumpExitReason::HostEof);
        REQUIRE(report.units == 3);
        REQUIRE(report.bytes == 3);
        REQUIRE_FALSE(active.load());
        link.near_end->Close();
        std::string wire;
        std::vector<uint8_t> buffer(4096);
        while (true) {
            const size_t count = link.far_end->Read(buffer).Unwrap();
            if (count == 0) {
                break;
            }
            wire.append(reinterpret_cast<const char*>(buffer.data()), count);
        }
        const auto lines = SplitLines(wire);
        REQUIRE(lines.size() == 3);
        REQUIRE(codec.DecryptString(lines[0]).Unwrap() == "o");
        REQUIRE(codec.DecryptString(lines[1]).Unwrap() == "k");
        REQUIRE(codec.DecryptString(lines[2]).Unwrap() == "\n");
    }
    SECTION("Encrypted lines decrypt back to the output") {
        const codec::PacketCodec codec("secret1");
        state->output.Push("ok\n");
        state->Exit();
        OutboundPump pump(host, *link.near_end, &codec, active, 2);
        const auto report = pump.Run();
        REQUIRE(report.reason == PumpExitReason::HostEof);
        REQUIRE(report.units == 2);
        std::string recovered;
        for (int i = 0; i < 2; ++i) {
            auto line = link.far_end->ReadLine().Unwrap();
            REQUIRE(line.has_value());
            recovered += codec.DecryptString(*line).Unwrap();
        }
        REQUIRE(recovered == "ok\n");
    }
    SECTION("Plain mode writes raw bytes") {
        state->output.Push("hello");
        state->Exit();
        OutboundPump pump(host, *link.near_end, nullptr, active, 64);
        const auto report = pump.Run();
        REQUIRE(report.reason == PumpExitReason::HostEof);
        REQUIRE(report.bytes == 5);
        link.near_end->Close();
        std::vector<uint8_t> buffer(16);
        const size_t count = link.far_end->Read(buffer).Unwrap();
        REQUIRE(std::string(buffer.begin(), buffer.begin() + static_cast<long>(count)) == "hello");
    }
    SECTION("Transport write failure ends the pump") {
        state->output.Push("x");
        link.near_end->FailWrites();
        OutboundPump pump(host, *link.near_end, nullptr, active);
        const auto report = pump.Run();
        REQUIRE(report.reason == PumpExitReason::TransportFailure);
        REQUIRE(report.failure.has_value());
        REQUIRE(report.failure->type == ChannelFailureType::Transport);
        REQUIRE(report.units == 0);
        REQUIRE_FALSE(active.load());
    }
    SECTION("Terminating the host unblocks a waiting pump") {
        OutboundPump pump(host, *link.near_end, nullptr, active);
        auto future = std::async(std::launch::async, [&pump] { return pump.Run(); });
        REQUIRE(future.wait_for(100ms) == std::future_status::timeout);
        host.Terminate();
        REQUIRE(future.wait_for(2s) == std::future_status::ready);
        REQUIRE(future.get().reason == PumpExitReason::HostEof);
    }
}
TEST_CASE("InboundPump - Transport to sink", "[relay][pump]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const codec::PacketCodec codec("secret1");
    auto link = MakeLink();
    RecordingSink sink;
    std::atomic<bool> active{true};
    const auto send_line = [&link](const std::string& line) {
        REQUIRE(link.far_end->Write(Bytes(line + "\n")).IsOk());
    };
    SECTION("Records are decrypted and delivered in order") {
        send_line(codec.EncryptString("who").Unwrap());
        send_line(codec.EncryptString("ami\n").Unwrap());
        link.far_end->Close();
        InboundPump pump(*link.near_end, sink, &codec, active);
        const auto report = pump.Run();
        REQUIRE(report.reason == PumpExitReason::TransportEof);
        REQUIRE(report.units == 2);
        REQUIRE(report.dropped == 0);
        REQUIRE(sink.Received() == "whoami\n");
        REQUIRE_FALSE(active.load());
    }
    SECTION("Bad records are dropped without output") {
        const codec::PacketCodec stranger("secret2");
        send_line("garbage");
        send_line(stranger.EncryptString("rm -rf /\n").Unwrap());
        send_line(codec.EncryptString("id\n").Unwrap());
        send_line("");
        link.far_end->Close();
        InboundPump pump(*link.near_end, sink, &codec, active);
        const auto report = pump.Run();
        REQUIRE(report.reason == PumpExitReason::TransportEof);
        REQUIRE(report.units == 1);
        REQUIRE(report.dropped == 3);
        REQUIRE(sink.Received() == "id\n");
        REQUIRE(sink.Deliveries() == 1);
    }
    SECTION("Plain mode forwards bytes unchanged") {
        send_line("whoami");
        link.far_end->Close();
        InboundPump pump(*link.near_end, sink, nullptr, active);
        const auto report = pump.Run();
        REQUIRE(report.reason == PumpExitReason::TransportEof);
        REQUIRE(sink.Received() == "whoami\n");
        REQUIRE(report.dropped == 0);
    }
    SECTION("Sink failure ends the pump") {
        sink.Fail();
        send_line(codec.EncryptString("ls\n").Unwrap());
        InboundPump pump(*link.near_end, sink, &codec, active);
        const auto report = pump.Run();
        REQUIRE(report.reason == PumpExitReason::SinkFailure);
        REQUIRE(report.failure.has_value());
        REQUIRE(report.failure->type == ChannelFailureType::HostIo);
        REQUIRE_FALSE(active.load());
    }
    SECTION("Closing the channel unblocks a waiting pump") {
        InboundPump pump(*link.near_end, sink, &codec, active);
        auto future = std::async(std::launch::async, [&pump] { return pump.Run(); });
        REQUIRE(future.wait_for(100ms) == std::future_status::timeout);
        link.near_end->Close();
        REQUIRE(future.wait_for(2s) == std::future_status::ready);
        REQUIRE(future.get().reason == PumpExitReason::TransportEof);
    }
}
TEST_CASE("InboundPump - Oversized record over a socket", "[relay][pump]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
    transport::TcpChannel input(fds[0], "input");
    transport::TcpChannel peer(fds[1], "peer");
    const codec::PacketCodec codec("secret1");
    std::string wire(Constants::MAX_BUNDLE_LINE_SIZE + 8192, 'A');
    wire += '\n';
    wire += codec.EncryptString("ls\n").Unwrap();
    wire += '\n';
    auto sending = std::async(std::launch::async, [&peer, &wire] {
        const bool written = peer.Write(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(wire.data()), wire.size())).IsOk();
        peer.Close();
        return written;
    });
    RecordingSink sink;
    std::atomic<bool> active{true};
    InboundPump pump(input, sink, &codec, active);
    const auto report = pump.Run();
    REQUIRE(sending.get());
    REQUIRE(report.reason == PumpExitReason::TransportEof);
    REQUIRE(report.dropped == 1);
    REQUIRE(report.units == 1);
    REQUIRE(sink.Received() == "ls\n");
}
TEST_CASE("StreamSink - Local output", "[relay][pump]") {
    std::ostringstream stream;
    StreamSink sink(stream);
    REQUIRE(sink.Deliver(Bytes("line one\n")).IsOk());
    REQUIRE(sink.Deliver(Bytes("line two\n")).IsOk());
    REQUIRE(stream.str() == "line one\nline two\n");
    stream.setstate(std::ios::badbit);
    auto result = sink.Deliver(Bytes("lost"));
    REQUIRE(result.IsErrAnd([](const ChannelFailure& f) {
        return f.type == ChannelFailureType::HostIo;
    }));
}
TEST_CASE("PumpExitReason - Names", "[relay][pump]") {
    REQUIRE(ToString(PumpExitReason::HostEof) == "HostEof");
    REQUIRE(ToString(PumpExitReason::TransportEof) == "TransportEof");
    REQUIRE(ToString(PumpExitReason::CodecFailure) == "CodecFailure");
}
