#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace shellpipe::channel {
struct Constants {
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t KDF_SALT_SIZE = 32;
    static constexpr uint32_t KDF_DEFAULT_ITERATIONS = 1000;
    static constexpr uint32_t DECOY_MIN_BYTES = 32;
    static constexpr uint32_t DECOY_MAX_BYTES = 1024;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
    static constexpr size_t MAX_BUNDLE_LINE_SIZE = 1024 * 1024;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view ALGORITHM_PBKDF2 = "PBKDF2";
    static constexpr std::string_view DIGEST_SHA256 = "SHA256";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct RelayConstants {
    static constexpr size_t DEFAULT_UNIT_BYTES = 1;
    static constexpr size_t MAX_UNIT_BYTES = 4096;
    static constexpr size_t READ_BUFFER_SIZE = 4096;
    static constexpr char RECORD_DELIMITER = '\n';
    static constexpr std::chrono::milliseconds POLL_INTERVAL{100};
    static constexpr std::chrono::milliseconds EXIT_GRACE_DELAY{500};
};
struct TransportConstants {
    static constexpr std::string_view LOCAL_MACHINE = "127.0.0.1";
    static constexpr uint16_t DEFAULT_PORT = 47100;
    static constexpr std::string_view STDOUT_CHANNEL_NAME = "ShellPipe_stdOutPipe";
    static constexpr std::string_view STDIN_CHANNEL_NAME = "ShellPipe_stdInPipe";
    static constexpr int LISTEN_BACKLOG = 1;
};
struct HostConstants {
    static constexpr std::string_view DEFAULT_SHELL = "/bin/sh";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view AES_GCM_AUTH_FAILED = "AES-GCM authentication tag mismatch";
    static constexpr std::string_view CHANNEL_CLOSED = "Channel closed";
};
}
