#pragma once
#include "shellpipe/core/result.hpp"
#include "shellpipe/core/failures.hpp"
#include "shellpipe/core/constants.hpp"
#include "shellpipe/codec/padding_strategy.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace shellpipe::proto::channel {
    class EncryptedBundle;
}

namespace shellpipe::channel::codec {

struct CodecOptions {
    uint32_t kdf_iterations = Constants::KDF_DEFAULT_ITERATIONS;
    std::shared_ptr<const IPaddingStrategy> padding;
};

/**
 * Turns payload bytes into self-contained encrypted bundle lines and back.
 *
 * Every Encrypt derives a fresh key from a fresh salt, draws fresh decoys
 * and a fresh nonce, so identical payloads never produce identical lines.
 * The codec keeps only the passphrase; key material lives for one call.
 *
 * Decrypt errors:
 *   - Decode: not base64, not a bundle, bad nonce/tag/salt size, or the
 *     authenticated plaintext is not a packet envelope
 *   - Decrypt: authentication failed (wrong passphrase or tampered bundle)
 *
 * Thread-safe: both pumps of a session may share one codec.
 */
class PacketCodec {
public:
    explicit PacketCodec(std::string passphrase, CodecOptions options = {});

    /**
     * @return Base64 bundle without a trailing newline
     */
    [[nodiscard]] Result<std::string, ChannelFailure> Encrypt(std::span<const uint8_t> payload) const;

    /**
     * @param line One bundle line; a trailing '\r' and '\n' are ignored
     */
    [[nodiscard]] Result<std::vector<uint8_t>, ChannelFailure> Decrypt(std::string_view line) const;

    [[nodiscard]] Result<std::string, ChannelFailure> EncryptString(std::string_view text) const;
    [[nodiscard]] Result<std::string, ChannelFailure> DecryptString(std::string_view line) const;

    [[nodiscard]] Result<proto::channel::EncryptedBundle, ChannelFailure>
    SealBundle(std::span<const uint8_t> payload) const;

    [[nodiscard]] Result<std::vector<uint8_t>, ChannelFailure>
    OpenBundle(const proto::channel::EncryptedBundle& bundle) const;

    [[nodiscard]] static Result<std::string, ChannelFailure>
    EncodeBundle(const proto::channel::EncryptedBundle& bundle);

    [[nodiscard]] static Result<proto::channel::EncryptedBundle, ChannelFailure>
    DecodeBundle(std::string_view line);

private:
    std::string passphrase_;
    uint32_t kdf_iterations_;
    std::shared_ptr<const IPaddingStrategy> padding_;
};
}
