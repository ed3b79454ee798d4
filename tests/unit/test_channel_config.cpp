#include <catch2/catch_test_macros.hpp>
#include "shellpipe/configuration/channel_config.hpp"
using namespace shellpipe::channel;
using namespace shellpipe::channel::configuration;
namespace {
    bool IsInvalidInput(const ChannelFailure& f) {
        return f.type == ChannelFailureType::InvalidInput;
    }
}
TEST_CASE("ChannelConfig - Defaults", "[configuration]") {
    SECTION("Server factory") {
        const auto config = ChannelConfig::Server();
        REQUIRE(config.IsServer());
        REQUIRE_FALSE(config.IsEncrypted());
        REQUIRE(config.port == TransportConstants::DEFAULT_PORT);
        REQUIRE(config.shell_path == HostConstants::DEFAULT_SHELL);
        REQUIRE(config.unit_bytes == RelayConstants::DEFAULT_UNIT_BYTES);
        REQUIRE(config.max_sessions == 0);
        REQUIRE(config.Validate().IsOk());
    }
    SECTION("Client factory") {
        const auto config = ChannelConfig::Client("10.0.0.5");
        REQUIRE_FALSE(config.IsServer());
        REQUIRE(config.remote_host == "10.0.0.5");
        REQUIRE(config.Validate().IsOk());
    }
    SECTION("Client defaults to the local machine") {
        REQUIRE(ChannelConfig::Client().remote_host == TransportConstants::LOCAL_MACHINE);
    }
    SECTION("Empty passphrase means plain mode") {
        auto config = ChannelConfig::Server();
        config.passphrase = "";
        REQUIRE_FALSE(config.IsEncrypted());
        config.passphrase = "secret1";
        REQUIRE(config.IsEncrypted());
    }
}
TEST_CASE("ChannelConfig - Validation", "[configuration]") {
    auto config = ChannelConfig::Server();
    SECTION("Port range") {
        config.port = 0;
        REQUIRE(config.Validate().IsErrAnd(IsInvalidInput));
        config.port = 65535;
        REQUIRE(config.Validate().IsErrAnd(IsInvalidInput));
        config.port = 65534;
        REQUIRE(config.Validate().IsOk());
    }
    SECTION("Codec parameters") {
        config.kdf_iterations = 0;
        REQUIRE(config.Validate().IsErrAnd(IsInvalidInput));
        config.kdf_iterations = 1;
        config.padding_min = 10;
        config.padding_max = 5;
        REQUIRE(config.Validate().IsErrAnd(IsInvalidInput));
    }
    SECTION("Unit size") {
        config.unit_bytes = 0;
        REQUIRE(config.Validate().IsErrAnd(IsInvalidInput));
        config.unit_bytes = RelayConstants::MAX_UNIT_BYTES + 1;
        REQUIRE(config.Validate().IsErrAnd(IsInvalidInput));
        config.unit_bytes = RelayConstants::MAX_UNIT_BYTES;
        REQUIRE(config.Validate().IsOk());
    }
    SECTION("Timing") {
        config.poll_interval = std::chrono::milliseconds(0);
        REQUIRE(config.Validate().IsErrAnd(IsInvalidInput));
        config.poll_interval = std::chrono::milliseconds(10);
        config.exit_grace = std::chrono::milliseconds(-1);
        REQUIRE(config.Validate().IsErrAnd(IsInvalidInput));
    }
    SECTION("Server needs a shell") {
        config.shell_path.clear();
        REQUIRE(config.Validate().IsErrAnd(IsInvalidInput));
    }
    SECTION("Password without a username") {
        config.identity.password = "hunter2";
        REQUIRE(config.Validate().IsErrAnd(IsInvalidInput));
        config.identity.username = "svc";
        REQUIRE(config.Validate().IsOk());
    }
    SECTION("Client rejects account options") {
        auto client = ChannelConfig::Client("host");
        client.identity.username = "svc";
        REQUIRE(client.Validate().IsErrAnd(IsInvalidInput));
    }
    SECTION("Client needs a host") {
        auto client = ChannelConfig::Client("");
        REQUIRE(client.Validate().IsErrAnd(IsInvalidInput));
    }
}
