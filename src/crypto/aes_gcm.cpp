#include "shellpipe/crypto/aes_gcm.hpp"
#include "shellpipe/crypto/sodium_interop.hpp"
#include "shellpipe/core/constants.hpp"
#include "shellpipe/core/format.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <memory>
namespace shellpipe::channel::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    void Wipe(std::vector<uint8_t>& buffer) {
        auto wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        (void)wipe;
    }
    std::optional<ChannelFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != Constants::AES_KEY_SIZE) {
            return ChannelFailure::InvalidInput(
                compat::format("AES-256-GCM key must be {} bytes, got {}",
                    Constants::AES_KEY_SIZE, key.size()));
        }
        if (nonce.size() != Constants::AES_GCM_NONCE_SIZE) {
            return ChannelFailure::InvalidInput(
                compat::format("AES-GCM nonce must be {} bytes, got {}",
                    Constants::AES_GCM_NONCE_SIZE, nonce.size()));
        }
        return std::nullopt;
    }
}
Result<AesGcm::Sealed, ChannelFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    using SealResult = Result<Sealed, ChannelFailure>;
    if (auto invalid = ValidateKeyAndNonce(key, nonce)) {
        return SealResult::Err(std::move(*invalid));
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return SealResult::Err(ChannelFailure::Generic(
            compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return SealResult::Err(ChannelFailure::Generic(
            compat::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return SealResult::Err(ChannelFailure::Generic(
            compat::format("Failed to set nonce length: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return SealResult::Err(ChannelFailure::Generic(
            compat::format("Failed to set key and nonce: {}", GetOpenSSLError())));
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return SealResult::Err(ChannelFailure::Generic(
                compat::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    Sealed sealed;
    sealed.ciphertext.resize(plaintext.size());
    int ciphertext_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), sealed.ciphertext.data(), &ciphertext_len,
                         plaintext.data(),
                         static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        Wipe(sealed.ciphertext);
        return SealResult::Err(ChannelFailure::Generic(
            compat::format("Encryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    // GCM is a stream mode: the final call flushes no extra bytes.
    if (EVP_EncryptFinal_ex(ctx.get(), sealed.ciphertext.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(sealed.ciphertext);
        return SealResult::Err(ChannelFailure::Generic(
            compat::format("Encryption finalization failed: {}", GetOpenSSLError())));
    }
    sealed.ciphertext.resize(static_cast<size_t>(ciphertext_len + final_len));
    sealed.tag.resize(Constants::AES_GCM_TAG_SIZE);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                           static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                           sealed.tag.data()) != OpenSSL::SUCCESS) {
        Wipe(sealed.ciphertext);
        return SealResult::Err(ChannelFailure::Generic(
            compat::format("Failed to get authentication tag: {}", GetOpenSSLError())));
    }
    return SealResult::Ok(std::move(sealed));
}
Result<std::vector<uint8_t>, ChannelFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> tag,
    std::span<const uint8_t> associated_data) {
    using OpenResult = Result<std::vector<uint8_t>, ChannelFailure>;
    if (auto invalid = ValidateKeyAndNonce(key, nonce)) {
        return OpenResult::Err(std::move(*invalid));
    }
    if (tag.size() != Constants::AES_GCM_TAG_SIZE) {
        return OpenResult::Err(ChannelFailure::InvalidInput(
            compat::format("AES-GCM tag must be {} bytes, got {}",
                Constants::AES_GCM_TAG_SIZE, tag.size())));
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return OpenResult::Err(ChannelFailure::Generic(
            compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return OpenResult::Err(ChannelFailure::Generic(
            compat::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return OpenResult::Err(ChannelFailure::Generic(
            compat::format("Failed to set nonce length: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return OpenResult::Err(ChannelFailure::Generic(
            compat::format("Failed to set key and nonce: {}", GetOpenSSLError())));
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return OpenResult::Err(ChannelFailure::Generic(
                compat::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    std::vector<uint8_t> output(ciphertext.size());
    int plaintext_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                         ciphertext.data(),
                         static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        Wipe(output);
        return OpenResult::Err(ChannelFailure::Generic(
            compat::format("Decryption failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> tag_copy(tag.begin(), tag.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                           static_cast<int>(tag_copy.size()),
                           tag_copy.data()) != OpenSSL::SUCCESS) {
        Wipe(output);
        return OpenResult::Err(ChannelFailure::Generic(
            compat::format("Failed to set authentication tag: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        ERR_clear_error();
        return OpenResult::Err(ChannelFailure::Decrypt(
            std::string(ErrorMessages::AES_GCM_AUTH_FAILED)));
    }
    output.resize(static_cast<size_t>(plaintext_len + final_len));
    return OpenResult::Ok(std::move(output));
}
}
