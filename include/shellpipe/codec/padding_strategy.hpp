#pragma once
#include "shellpipe/core/result.hpp"
#include "shellpipe/core/failures.hpp"
#include "shellpipe/core/constants.hpp"
#include <cstdint>
#include <memory>
#include <vector>
namespace shellpipe::channel::codec {

/**
 * Source of decoy bytes placed around the payload before encryption.
 *
 * Called twice per bundle (prefix and suffix), so implementations must be
 * safe to call from both pumps of a session at once.
 */
class IPaddingStrategy {
public:
    virtual ~IPaddingStrategy() = default;

    [[nodiscard]] virtual std::vector<uint8_t> NextDecoy() const = 0;

    [[nodiscard]] virtual uint32_t MinLength() const noexcept = 0;
    [[nodiscard]] virtual uint32_t MaxLength() const noexcept = 0;
};

/**
 * Decoy of uniformly random length in [min, max], filled with CSPRNG bytes.
 */
class UniformRangePadding final : public IPaddingStrategy {
public:
    /**
     * @return InvalidInput when min > max
     */
    [[nodiscard]] static Result<std::shared_ptr<UniformRangePadding>, ChannelFailure> Create(
        uint32_t min_length = Constants::DECOY_MIN_BYTES,
        uint32_t max_length = Constants::DECOY_MAX_BYTES);

    [[nodiscard]] static std::shared_ptr<UniformRangePadding> Default();

    [[nodiscard]] std::vector<uint8_t> NextDecoy() const override;

    [[nodiscard]] uint32_t NextLength() const;

    [[nodiscard]] uint32_t MinLength() const noexcept override { return min_length_; }
    [[nodiscard]] uint32_t MaxLength() const noexcept override { return max_length_; }

private:
    UniformRangePadding(uint32_t min_length, uint32_t max_length) noexcept
        : min_length_(min_length), max_length_(max_length) {}

    uint32_t min_length_;
    uint32_t max_length_;
};
}
