#include <catch2/catch_test_macros.hpp>
#include "cipherlink/crypto/aes_gcm.hpp"
#include "cipherlink/crypto/sodium_interop.hpp"
#include "cipherlink/core/constants.hpp"

using namespace cipherlink;
using namespace cipherlink::crypto;

TEST_CASE("AES-GCM - Encryption and decryption", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    const std::vector<uint8_t> key(Constants::AES_KEY_SIZE, 0xAA);
    const std::vector<uint8_t> nonce(Constants::AES_GCM_NONCE_SIZE, 0xBB);

    SECTION("Output is plaintext plus tag") {
        const std::vector<uint8_t> plaintext = {'h', 'e', 'l', 'l', 'o'};
        auto sealed = AesGcm::Encrypt(key, nonce, plaintext);
        REQUIRE(sealed.IsOk());
        REQUIRE(sealed.Unwrap().size() == plaintext.size() + Constants::AES_GCM_TAG_SIZE);

        auto opened = AesGcm::Decrypt(key, nonce, sealed.Unwrap());
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == plaintext);
    }
    SECTION("Empty plaintext yields a bare tag") {
        auto sealed = AesGcm::Encrypt(key, nonce, std::vector<uint8_t>{});
        REQUIRE(sealed.Unwrap().size() == Constants::AES_GCM_TAG_SIZE);
        REQUIRE(AesGcm::Decrypt(key, nonce, sealed.Unwrap()).Unwrap().empty());
    }
}

TEST_CASE("AES-GCM - Authentication failures", "[aes_gcm][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    const std::vector<uint8_t> key(Constants::AES_KEY_SIZE, 0x11);
    const std::vector<uint8_t> nonce(Constants::AES_GCM_NONCE_SIZE, 0x22);
    const std::vector<uint8_t> plaintext(64, 0x33);
    const std::vector<uint8_t> ad = {'a', 'd'};
    auto sealed = AesGcm::Encrypt(key, nonce, plaintext, ad).Unwrap();

    auto expect_auth_failure = [](const Result<std::vector<uint8_t>, CipherlinkFailure>& result) {
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == FailureType::Authentication);
    };

    SECTION("Wrong key") {
        const std::vector<uint8_t> other(Constants::AES_KEY_SIZE, 0x12);
        expect_auth_failure(AesGcm::Decrypt(other, nonce, sealed, ad));
    }
    SECTION("Wrong nonce") {
        const std::vector<uint8_t> other(Constants::AES_GCM_NONCE_SIZE, 0x23);
        expect_auth_failure(AesGcm::Decrypt(key, other, sealed, ad));
    }
    SECTION("Wrong associated data") {
        const std::vector<uint8_t> other = {'x'};
        expect_auth_failure(AesGcm::Decrypt(key, nonce, sealed, other));
    }
    SECTION("Flipped ciphertext bit") {
        sealed[0] ^= 0x01;
        expect_auth_failure(AesGcm::Decrypt(key, nonce, sealed, ad));
    }
    SECTION("Flipped tag bit") {
        sealed.back() ^= 0x80;
        expect_auth_failure(AesGcm::Decrypt(key, nonce, sealed, ad));
    }
}

TEST_CASE("AES-GCM - Input validation", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    const std::vector<uint8_t> key(Constants::AES_KEY_SIZE, 0x01);
    const std::vector<uint8_t> nonce(Constants::AES_GCM_NONCE_SIZE, 0x02);
    const std::vector<uint8_t> plaintext = {1, 2, 3};

    SECTION("Short key") {
        const std::vector<uint8_t> short_key(16, 0x01);
        auto result = AesGcm::Encrypt(short_key, nonce, plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == FailureType::InvalidInput);
    }
    SECTION("Long nonce") {
        const std::vector<uint8_t> long_nonce(16, 0x02);
        REQUIRE(AesGcm::Encrypt(key, long_nonce, plaintext).UnwrapErr().type == FailureType::InvalidInput);
    }
    SECTION("Ciphertext shorter than a tag") {
        const std::vector<uint8_t> stub(Constants::AES_GCM_TAG_SIZE - 1, 0x00);
        REQUIRE(AesGcm::Decrypt(key, nonce, stub).IsErr());
    }
}
