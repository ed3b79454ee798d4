#include "shellpipe/codec/padding_strategy.hpp"
#include "shellpipe/crypto/sodium_interop.hpp"
#include "shellpipe/core/format.hpp"
namespace shellpipe::channel::codec {
using crypto::SodiumInterop;

Result<std::shared_ptr<UniformRangePadding>, ChannelFailure> UniformRangePadding::Create(
    const uint32_t min_length,
    const uint32_t max_length) {
    if (min_length > max_length) {
        return Result<std::shared_ptr<UniformRangePadding>, ChannelFailure>::Err(
            ChannelFailure::InvalidInput(compat::format(
                "Decoy range is empty: min {} exceeds max {}", min_length, max_length)));
    }
    if (max_length == UINT32_MAX) {
        return Result<std::shared_ptr<UniformRangePadding>, ChannelFailure>::Err(
            ChannelFailure::InvalidInput("Decoy max length is out of range"));
    }
    return Result<std::shared_ptr<UniformRangePadding>, ChannelFailure>::Ok(
        std::shared_ptr<UniformRangePadding>(new UniformRangePadding(min_length, max_length)));
}

std::shared_ptr<UniformRangePadding> UniformRangePadding::Default() {
    return std::shared_ptr<UniformRangePadding>(
        new UniformRangePadding(Constants::DECOY_MIN_BYTES, Constants::DECOY_MAX_BYTES));
}

uint32_t UniformRangePadding::NextLength() const {
    const uint32_t span = max_length_ - min_length_ + 1;
    return min_length_ + SodiumInterop::GenerateUniform(span);
}

std::vector<uint8_t> UniformRangePadding::NextDecoy() const {
    return SodiumInterop::GetRandomBytes(NextLength());
}
}
