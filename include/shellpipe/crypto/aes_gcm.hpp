#pragma once
#include "shellpipe/core/result.hpp"
#include "shellpipe/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace shellpipe::channel::crypto {

/**
 * AES-256-GCM with a detached authentication tag.
 *
 * Stateless primitive: the caller supplies a fresh (key, nonce) pair for
 * every call. The packet codec derives a new key per bundle from a fresh
 * salt and draws a random 96-bit nonce, so a pair is never reused in
 * practice.
 *
 * Decrypt reports a Decrypt failure when the tag does not verify (wrong
 * key, tampered ciphertext or tag, mismatched nonce) and InvalidInput when
 * a size is wrong. It never returns unauthenticated plaintext.
 */
class AesGcm {
public:
    struct Sealed {
        std::vector<uint8_t> ciphertext;
        std::vector<uint8_t> tag;
    };

    [[nodiscard]] static Result<Sealed, ChannelFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    [[nodiscard]] static Result<std::vector<uint8_t>, ChannelFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
