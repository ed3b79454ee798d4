#include <catch2/catch_test_macros.hpp>
#include "shellpipe/crypto/passphrase_kdf.hpp"
#include "shellpipe/crypto/sodium_interop.hpp"
#include "shellpipe/core/constants.hpp"
using namespace shellpipe::channel;
using namespace shellpipe::channel::crypto;
TEST_CASE("PassphraseKdf - Derivation", "[kdf][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Fresh salt when none is given") {
        auto first = PassphraseKdf::Derive("secret1");
        auto second = PassphraseKdf::Derive("secret1");
        REQUIRE(first.IsOk());
        REQUIRE(second.IsOk());
        REQUIRE(first.Unwrap().key.size() == Constants::AES_KEY_SIZE);
        REQUIRE(first.Unwrap().salt.size() == Constants::KDF_SALT_SIZE);
        REQUIRE(first.Unwrap().salt != second.Unwrap().salt);
        REQUIRE(first.Unwrap().key != second.Unwrap().key);
    }
    SECTION("Same passphrase and salt give the same key") {
        auto first = PassphraseKdf::Derive("secret1");
        REQUIRE(first.IsOk());
        const auto& salt = first.Unwrap().salt;
        auto again = PassphraseKdf::Derive("secret1", std::span<const uint8_t>(salt));
        REQUIRE(again.IsOk());
        REQUIRE(again.Unwrap().key == first.Unwrap().key);
        REQUIRE(again.Unwrap().salt == salt);
    }
    SECTION("Different passphrase gives a different key") {
        auto first = PassphraseKdf::Derive("secret1");
        const auto& salt = first.Unwrap().salt;
        auto other = PassphraseKdf::Derive("secret2", std::span<const uint8_t>(salt));
        REQUIRE(other.IsOk());
        REQUIRE(other.Unwrap().key != first.Unwrap().key);
    }
    SECTION("Iteration count is part of the key") {
        const std::vector<uint8_t> salt(Constants::KDF_SALT_SIZE, 0x5A);
        auto a = PassphraseKdf::Derive("secret1", std::span<const uint8_t>(salt), 1000);
        auto b = PassphraseKdf::Derive("secret1", std::span<const uint8_t>(salt), 1001);
        REQUIRE(a.Unwrap().key != b.Unwrap().key);
    }
    SECTION("Empty passphrase is accepted") {
        auto result = PassphraseKdf::Derive("");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().key.size() == Constants::AES_KEY_SIZE);
    }
}
TEST_CASE("PassphraseKdf - Invalid input", "[kdf][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto is_invalid_input = [](const ChannelFailure& f) {
        return f.type == ChannelFailureType::InvalidInput;
    };
    SECTION("Short salt") {
        const std::vector<uint8_t> salt(16, 0x01);
        REQUIRE(PassphraseKdf::Derive("secret1", std::span<const uint8_t>(salt)).IsErrAnd(is_invalid_input));
    }
    SECTION("Zero iterations") {
        REQUIRE(PassphraseKdf::Derive("secret1", std::nullopt, 0).IsErrAnd(is_invalid_input));
    }
}
