#pragma once
#include <string>
#include <string_view>
namespace shellpipe::channel {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooLarge
};
enum class ChannelFailureType {
    Generic,
    InvalidInput,
    DeriveKey,
    Encode,
    Decode,
    Decrypt,
    Transport,
    HostSpawn,
    HostIo
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
};
/**
 * Failure value carried by every fallible operation of the channel.
 *
 * Decrypt and Decode are per-unit failures the relay drops silently.
 * Transport ends a session, HostSpawn ends a server run.
 */
class ChannelFailure {
public:
    ChannelFailureType type;
    std::string message;
    ChannelFailure(const ChannelFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ChannelFailure Generic(std::string msg) {
        return {ChannelFailureType::Generic, std::move(msg)};
    }
    static ChannelFailure InvalidInput(std::string msg) {
        return {ChannelFailureType::InvalidInput, std::move(msg)};
    }
    static ChannelFailure DeriveKey(std::string msg) {
        return {ChannelFailureType::DeriveKey, std::move(msg)};
    }
    static ChannelFailure Encode(std::string msg) {
        return {ChannelFailureType::Encode, std::move(msg)};
    }
    static ChannelFailure Decode(std::string msg) {
        return {ChannelFailureType::Decode, std::move(msg)};
    }
    static ChannelFailure Decrypt(std::string msg) {
        return {ChannelFailureType::Decrypt, std::move(msg)};
    }
    static ChannelFailure Transport(std::string msg) {
        return {ChannelFailureType::Transport, std::move(msg)};
    }
    static ChannelFailure HostSpawn(std::string msg) {
        return {ChannelFailureType::HostSpawn, std::move(msg)};
    }
    static ChannelFailure HostIo(std::string msg) {
        return {ChannelFailureType::HostIo, std::move(msg)};
    }
    static ChannelFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
    [[nodiscard]] bool IsCryptoUnitFailure() const noexcept {
        return type == ChannelFailureType::Decrypt || type == ChannelFailureType::Decode;
    }
};
inline std::string_view ToString(const ChannelFailureType type) noexcept {
    switch (type) {
        case ChannelFailureType::Generic: return "Generic";
        case ChannelFailureType::InvalidInput: return "InvalidInput";
        case ChannelFailureType::DeriveKey: return "DeriveKey";
        case ChannelFailureType::Encode: return "Encode";
        case ChannelFailureType::Decode: return "Decode";
        case ChannelFailureType::Decrypt: return "Decrypt";
        case ChannelFailureType::Transport: return "Transport";
        case ChannelFailureType::HostSpawn: return "HostSpawn";
        case ChannelFailureType::HostIo: return "HostIo";
    }
    return "Unknown";
}
}
