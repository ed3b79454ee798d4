#pragma once
#include "shellpipe/core/result.hpp"
#include "shellpipe/core/failures.hpp"
#include "shellpipe/core/constants.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>
namespace shellpipe::channel::crypto {

/**
 * Key material for a single encrypt or decrypt call.
 *
 * The key is wiped when the value is destroyed. Not copyable, so a key
 * never outlives the call that derived it by accident.
 */
struct DerivedKey {
    std::vector<uint8_t> key;
    std::vector<uint8_t> salt;

    DerivedKey() = default;
    DerivedKey(std::vector<uint8_t> derived_key, std::vector<uint8_t> derived_salt)
        : key(std::move(derived_key)), salt(std::move(derived_salt)) {}
    DerivedKey(const DerivedKey&) = delete;
    DerivedKey& operator=(const DerivedKey&) = delete;
    DerivedKey(DerivedKey&&) noexcept = default;
    DerivedKey& operator=(DerivedKey&&) noexcept = default;
    ~DerivedKey();
};

/**
 * PBKDF2-HMAC-SHA256 over a shared passphrase.
 *
 * Both peers must use the same iteration count. The count is modest and
 * the derivation is not meant to resist offline guessing; it only has to
 * be deterministic for a given (passphrase, salt, iterations).
 */
class PassphraseKdf {
public:
    /**
     * @param salt Salt of exactly KDF_SALT_SIZE bytes, or std::nullopt to
     *             draw a fresh random one
     * @return The 32-byte key together with the salt that produced it
     */
    [[nodiscard]] static Result<DerivedKey, ChannelFailure> Derive(
        std::string_view passphrase,
        std::optional<std::span<const uint8_t>> salt = std::nullopt,
        uint32_t iterations = Constants::KDF_DEFAULT_ITERATIONS);
private:
    PassphraseKdf() = delete;
};
}
