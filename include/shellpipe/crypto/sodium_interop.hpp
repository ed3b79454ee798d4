#pragma once

#include "shellpipe/core/result.hpp"
#include "shellpipe/core/failures.hpp"
#include "shellpipe/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace shellpipe::channel::crypto {

/**
 * @brief Interop layer for libsodium operations used by the channel
 *
 * Covers the CSPRNG (salts, nonces, decoy bytes and lengths), secure
 * wiping of key material and the line-safe base64 encoding of bundles.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium library
     *
     * Must be called before any other sodium operations.
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are cleared through a volatile pointer, larger ones
     * with sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /**
     * @brief Uniform random value in [0, upper_bound)
     *
     * Backed by randombytes_uniform, so there is no modulo bias.
     */
    static uint32_t GenerateUniform(uint32_t upper_bound);

    /**
     * @brief Standard base64 (with padding) of the input
     *
     * The output never contains line breaks.
     */
    static std::string ToBase64(std::span<const uint8_t> data);

    /**
     * @brief Decode standard base64
     *
     * @return std::nullopt when the input is not valid base64
     */
    static std::optional<std::vector<uint8_t>> FromBase64(std::string_view encoded);

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace shellpipe::channel::crypto
