#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace cipherlink {
struct Constants {
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t SHA_256_DIGEST_SIZE = 32;
    static constexpr size_t P_384_COORDINATE_SIZE = 48;
    static constexpr size_t P_384_SHARED_SECRET_SIZE = 48;
    // 0x04 || X || Y
    static constexpr size_t P_384_RAW_PUBLIC_KEY_SIZE = 1 + 2 * P_384_COORDINATE_SIZE;
    static constexpr uint8_t UNCOMPRESSED_POINT_TAG = 0x04;
    static constexpr size_t IDENTITY_HASH_SIZE = 64;
    static constexpr size_t ACCOUNT_UUID_BYTES = 32;
    static constexpr size_t MASTER_SECRET_SIZE = 32;
    // Shortest salt the Argon2 reference implementation accepts
    static constexpr size_t ARGON2_MIN_SALT_SIZE = 8;
    static constexpr size_t ARGON2_SALT_SIZE = 16;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;
};
struct WireConstants {
    static constexpr size_t KEY_LENGTH_PREFIX_SIZE = 1;
    static constexpr size_t KEYED_HEADER_SIZE = KEY_LENGTH_PREFIX_SIZE + Constants::P_384_RAW_PUBLIC_KEY_SIZE;
    static constexpr size_t MIN_ENVELOPE_SIZE = Constants::AES_GCM_NONCE_SIZE + Constants::AES_GCM_TAG_SIZE;
    static constexpr size_t MAX_PAYLOAD_SIZE = 10 * 1024 * 1024;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view CURVE_P_384 = "P-384";
    static constexpr std::string_view KEY_TYPE_EC = "EC";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};
struct StoreNamespaces {
    static constexpr std::string_view IDENTITY = "identity";
    static constexpr std::string_view PEER_KEYS = "peer_keys";
    static constexpr std::string_view CONVERSATION_SECRETS = "conversation_secrets";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view AES_GCM_AUTHENTICATION_FAILED = "AES-GCM decryption failed (authentication tag mismatch)";
    static constexpr std::string_view CIPHERTEXT_TOO_SMALL = "Ciphertext too small";
    static constexpr std::string_view NO_ACTIVE_CALL = "No active call";
    static constexpr std::string_view NO_PRIVATE_KEY = "Local key pair has no private component";
};
struct DisplayText {
    static constexpr std::string_view UNDECRYPTABLE_MESSAGE = "[encrypted message - key mismatch]";
};
}
