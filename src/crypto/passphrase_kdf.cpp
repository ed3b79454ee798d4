#include "shellpipe/crypto/passphrase_kdf.hpp"
#include "shellpipe/crypto/sodium_interop.hpp"
#include "shellpipe/core/format.hpp"
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
namespace shellpipe::channel::crypto {
using OpenSSL = OpenSSLConstants;

DerivedKey::~DerivedKey() {
    if (!key.empty()) {
        auto wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(key));
        (void)wipe;
    }
}

Result<DerivedKey, ChannelFailure> PassphraseKdf::Derive(
    std::string_view passphrase,
    std::optional<std::span<const uint8_t>> salt,
    const uint32_t iterations) {
    using DeriveResult = Result<DerivedKey, ChannelFailure>;
    if (iterations == 0) {
        return DeriveResult::Err(
            ChannelFailure::InvalidInput("PBKDF2 iteration count must be positive"));
    }
    std::vector<uint8_t> salt_bytes;
    if (salt.has_value()) {
        if (salt->size() != Constants::KDF_SALT_SIZE) {
            return DeriveResult::Err(ChannelFailure::InvalidInput(
                compat::format("KDF salt must be {} bytes, got {}",
                    Constants::KDF_SALT_SIZE, salt->size())));
        }
        salt_bytes.assign(salt->begin(), salt->end());
    } else {
        salt_bytes = SodiumInterop::GetRandomBytes(Constants::KDF_SALT_SIZE);
    }
    std::vector<uint8_t> key(Constants::AES_KEY_SIZE);
    try {
        EVP_KDF* kdf = EVP_KDF_fetch(nullptr, OpenSSL::ALGORITHM_PBKDF2.data(), nullptr);
        if (!kdf) {
            return DeriveResult::Err(
                ChannelFailure::DeriveKey("Failed to fetch PBKDF2 algorithm"));
        }
        EVP_KDF_CTX* kctx = EVP_KDF_CTX_new(kdf);
        EVP_KDF_free(kdf);
        if (!kctx) {
            return DeriveResult::Err(
                ChannelFailure::DeriveKey("Failed to create PBKDF2 context"));
        }
        uint64_t iteration_count = iterations;
        char empty_passphrase[] = "";
        char* pass = passphrase.empty()
            ? empty_passphrase
            : const_cast<char*>(passphrase.data());
        OSSL_PARAM params[5];
        int param_idx = 0;
        params[param_idx++] = OSSL_PARAM_construct_utf8_string(
            "digest", const_cast<char*>(OpenSSL::DIGEST_SHA256.data()), 0);
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            "pass", pass, passphrase.size());
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            "salt", salt_bytes.data(), salt_bytes.size());
        params[param_idx++] = OSSL_PARAM_construct_uint64("iter", &iteration_count);
        params[param_idx] = OSSL_PARAM_construct_end();
        const int result = EVP_KDF_derive(kctx, key.data(), key.size(), params);
        EVP_KDF_CTX_free(kctx);
        if (result != OpenSSL::SUCCESS) {
            auto wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(key));
            (void)wipe;
            return DeriveResult::Err(
                ChannelFailure::DeriveKey("PBKDF2 key derivation failed"));
        }
    } catch (const std::exception& ex) {
        return DeriveResult::Err(ChannelFailure::DeriveKey(
            compat::format("PBKDF2 derivation exception: {}", ex.what())));
    }
    return DeriveResult::Ok(DerivedKey(std::move(key), std::move(salt_bytes)));
}
}
