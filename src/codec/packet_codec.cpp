#include "shellpipe/codec/packet_codec.hpp"
#include "shellpipe/crypto/aes_gcm.hpp"
#include "shellpipe/crypto/passphrase_kdf.hpp"
#include "shellpipe/crypto/sodium_interop.hpp"
#include "shellpipe/core/format.hpp"
#include "channel/bundle.pb.h"

namespace shellpipe::channel::codec {
using crypto::AesGcm;
using crypto::PassphraseKdf;
using crypto::SodiumInterop;

namespace {
    std::span<const uint8_t> AsBytes(const std::string& field) {
        return {reinterpret_cast<const uint8_t*>(field.data()), field.size()};
    }

    void WipeString(std::string& buffer) {
        auto wipe = SodiumInterop::SecureWipe(
            std::span<uint8_t>(reinterpret_cast<uint8_t*>(buffer.data()), buffer.size()));
        (void)wipe;
    }
}

PacketCodec::PacketCodec(std::string passphrase, CodecOptions options)
    : passphrase_(std::move(passphrase))
    , kdf_iterations_(options.kdf_iterations)
    , padding_(options.padding ? std::move(options.padding) : UniformRangePadding::Default()) {
}

Result<proto::channel::EncryptedBundle, ChannelFailure>
PacketCodec::SealBundle(std::span<const uint8_t> payload) const {
    using SealResult = Result<proto::channel::EncryptedBundle, ChannelFailure>;
    auto derive_result = PassphraseKdf::Derive(passphrase_, std::nullopt, kdf_iterations_);
    SPP_TRY(derive_result);
    const crypto::DerivedKey derived = std::move(derive_result).Unwrap();

    std::string packet_bytes;
    try {
        proto::channel::EncryptedPacket packet;
        const auto prefix = padding_->NextDecoy();
        const auto suffix = padding_->NextDecoy();
        packet.set_decoy_prefix(prefix.data(), prefix.size());
        packet.set_payload(payload.data(), payload.size());
        packet.set_decoy_suffix(suffix.data(), suffix.size());
        if (!packet.SerializeToString(&packet_bytes)) {
            return SealResult::Err(
                ChannelFailure::Encode("Failed to serialize EncryptedPacket to protobuf"));
        }
    } catch (const std::exception& ex) {
        WipeString(packet_bytes);
        return SealResult::Err(ChannelFailure::Encode(
            compat::format("Exception during packet serialization: {}", ex.what())));
    }

    const auto nonce = SodiumInterop::GetRandomBytes(Constants::AES_GCM_NONCE_SIZE);
    auto encrypt_result = AesGcm::Encrypt(derived.key, nonce, AsBytes(packet_bytes));
    WipeString(packet_bytes);
    if (encrypt_result.IsErr()) {
        return SealResult::Err(ChannelFailure::Generic(compat::format(
            "Failed to encrypt packet: {}", encrypt_result.UnwrapErr().message)));
    }
    auto sealed = std::move(encrypt_result).Unwrap();

    proto::channel::EncryptedBundle bundle;
    bundle.set_ciphertext(sealed.ciphertext.data(), sealed.ciphertext.size());
    bundle.set_nonce(nonce.data(), nonce.size());
    bundle.set_tag(sealed.tag.data(), sealed.tag.size());
    bundle.set_salt(derived.salt.data(), derived.salt.size());
    return SealResult::Ok(std::move(bundle));
}

Result<std::vector<uint8_t>, ChannelFailure>
PacketCodec::OpenBundle(const proto::channel::EncryptedBundle& bundle) const {
    using OpenResult = Result<std::vector<uint8_t>, ChannelFailure>;
    if (bundle.nonce().size() != Constants::AES_GCM_NONCE_SIZE ||
        bundle.tag().size() != Constants::AES_GCM_TAG_SIZE ||
        bundle.salt().size() != Constants::KDF_SALT_SIZE) {
        return OpenResult::Err(ChannelFailure::Decode(compat::format(
            "Malformed bundle: nonce {} bytes, tag {} bytes, salt {} bytes",
            bundle.nonce().size(), bundle.tag().size(), bundle.salt().size())));
    }

    auto derive_result = PassphraseKdf::Derive(
        passphrase_, AsBytes(bundle.salt()), kdf_iterations_);
    SPP_TRY(derive_result);
    const crypto::DerivedKey derived = std::move(derive_result).Unwrap();

    auto decrypt_result = AesGcm::Decrypt(
        derived.key,
        AsBytes(bundle.nonce()),
        AsBytes(bundle.ciphertext()),
        AsBytes(bundle.tag()));
    SPP_TRY(decrypt_result);
    auto packet_bytes = std::move(decrypt_result).Unwrap();

    try {
        proto::channel::EncryptedPacket packet;
        const bool parsed = packet.ParseFromArray(
            packet_bytes.data(), static_cast<int>(packet_bytes.size()));
        auto wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(packet_bytes));
        (void)wipe;
        if (!parsed) {
            return OpenResult::Err(
                ChannelFailure::Decode("Failed to parse decrypted EncryptedPacket"));
        }
        const std::string& payload = packet.payload();
        return OpenResult::Ok(std::vector<uint8_t>(payload.begin(), payload.end()));
    } catch (const std::exception& ex) {
        auto wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(packet_bytes));
        (void)wipe;
        return OpenResult::Err(ChannelFailure::Decode(
            compat::format("Exception during packet parsing: {}", ex.what())));
    }
}

Result<std::string, ChannelFailure>
PacketCodec::EncodeBundle(const proto::channel::EncryptedBundle& bundle) {
    std::vector<uint8_t> bundle_bytes;
    try {
        const size_t size = bundle.ByteSizeLong();
        bundle_bytes.resize(size);
        if (!bundle.SerializeToArray(bundle_bytes.data(), static_cast<int>(size))) {
            return Result<std::string, ChannelFailure>::Err(
                ChannelFailure::Encode("Failed to serialize EncryptedBundle to protobuf"));
        }
    } catch (const std::exception& ex) {
        return Result<std::string, ChannelFailure>::Err(ChannelFailure::Encode(
            compat::format("Exception during bundle serialization: {}", ex.what())));
    }
    return Result<std::string, ChannelFailure>::Ok(SodiumInterop::ToBase64(bundle_bytes));
}

Result<proto::channel::EncryptedBundle, ChannelFailure>
PacketCodec::DecodeBundle(std::string_view line) {
    using DecodeResult = Result<proto::channel::EncryptedBundle, ChannelFailure>;
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }
    if (line.empty()) {
        return DecodeResult::Err(ChannelFailure::Decode("Empty bundle line"));
    }
    if (line.size() > Constants::MAX_BUNDLE_LINE_SIZE) {
        return DecodeResult::Err(ChannelFailure::Decode(compat::format(
            "Bundle line of {} bytes exceeds {}", line.size(), Constants::MAX_BUNDLE_LINE_SIZE)));
    }
    auto bundle_bytes = SodiumInterop::FromBase64(line);
    if (!bundle_bytes.has_value()) {
        return DecodeResult::Err(ChannelFailure::Decode("Bundle line is not valid base64"));
    }
    try {
        proto::channel::EncryptedBundle bundle;
        if (!bundle.ParseFromArray(bundle_bytes->data(), static_cast<int>(bundle_bytes->size()))) {
            return DecodeResult::Err(
                ChannelFailure::Decode("Failed to parse EncryptedBundle from protobuf"));
        }
        return DecodeResult::Ok(std::move(bundle));
    } catch (const std::exception& ex) {
        return DecodeResult::Err(ChannelFailure::Decode(
            compat::format("Exception during bundle parsing: {}", ex.what())));
    }
}

Result<std::string, ChannelFailure> PacketCodec::Encrypt(std::span<const uint8_t> payload) const {
    auto seal_result = SealBundle(payload);
    SPP_TRY(seal_result);
    return EncodeBundle(seal_result.Unwrap());
}

Result<std::vector<uint8_t>, ChannelFailure> PacketCodec::Decrypt(std::string_view line) const {
    auto decode_result = DecodeBundle(line);
    SPP_TRY(decode_result);
    return OpenBundle(decode_result.Unwrap());
}

Result<std::string, ChannelFailure> PacketCodec::EncryptString(std::string_view text) const {
    return Encrypt(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

Result<std::string, ChannelFailure> PacketCodec::DecryptString(std::string_view line) const {
    return Decrypt(line).Map([](std::vector<uint8_t> payload) {
        return std::string(payload.begin(), payload.end());
    });
}
}
