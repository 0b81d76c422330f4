#include <catch2/catch_test_macros.hpp>
#include "cipherlink/crypto/p384_key_agreement.hpp"
#include "cipherlink/crypto/base64.hpp"
#include "cipherlink/crypto/sodium_interop.hpp"
#include "cipherlink/core/constants.hpp"

using namespace cipherlink;
using namespace cipherlink::crypto;

TEST_CASE("P384KeyAgreement - Shared secret", "[p384][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    auto alice = P384KeyAgreement::GenerateKeyPair();
    auto bob = P384KeyAgreement::GenerateKeyPair();
    REQUIRE(alice.IsOk());
    REQUIRE(bob.IsOk());

    SECTION("Derivation is commutative") {
        auto ab = P384KeyAgreement::DeriveSharedSecret(alice.Unwrap(), bob.Unwrap());
        auto ba = P384KeyAgreement::DeriveSharedSecret(bob.Unwrap(), alice.Unwrap());
        REQUIRE(ab.IsOk());
        REQUIRE(ba.IsOk());
        REQUIRE(ab.Unwrap() == ba.Unwrap());
    }
    SECTION("Secret is base64 of a SHA-256 digest") {
        auto secret = P384KeyAgreement::DeriveSharedSecret(alice.Unwrap(), bob.Unwrap());
        auto decoded = Base64::Decode(secret.Unwrap());
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap().size() == Constants::SHA_256_DIGEST_SIZE);
    }
    SECTION("Secret agrees after a raw export and import") {
        auto bob_raw = P384KeyAgreement::ExportPublicRaw(bob.Unwrap());
        REQUIRE(bob_raw.IsOk());
        auto bob_public = P384KeyAgreement::ImportPublicRaw(bob_raw.Unwrap());
        REQUIRE(bob_public.IsOk());
        REQUIRE_FALSE(bob_public.Unwrap().HasPrivate());

        auto via_import = P384KeyAgreement::DeriveSharedSecret(alice.Unwrap(), bob_public.Unwrap());
        auto direct = P384KeyAgreement::DeriveSharedSecret(alice.Unwrap(), bob.Unwrap());
        REQUIRE(via_import.Unwrap() == direct.Unwrap());
    }
    SECTION("A third party derives something else") {
        auto carol = P384KeyAgreement::GenerateKeyPair();
        auto ab = P384KeyAgreement::DeriveSharedSecret(alice.Unwrap(), bob.Unwrap());
        auto cb = P384KeyAgreement::DeriveSharedSecret(carol.Unwrap(), bob.Unwrap());
        REQUIRE(ab.Unwrap() != cb.Unwrap());
    }
    SECTION("A public-only key cannot be the private side") {
        auto bob_raw = P384KeyAgreement::ExportPublicRaw(bob.Unwrap());
        auto bob_public = P384KeyAgreement::ImportPublicRaw(bob_raw.Unwrap());
        auto result = P384KeyAgreement::DeriveSharedSecret(bob_public.Unwrap(), alice.Unwrap());
        REQUIRE(result.IsErr());
    }
}

TEST_CASE("P384KeyAgreement - Raw encoding", "[p384][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    auto key = P384KeyAgreement::GenerateKeyPair();
    REQUIRE(key.IsOk());

    SECTION("Raw public key is a 97-byte uncompressed point") {
        auto raw = P384KeyAgreement::ExportPublicRaw(key.Unwrap());
        REQUIRE(raw.IsOk());
        REQUIRE(raw.Unwrap().size() == Constants::P_384_RAW_PUBLIC_KEY_SIZE);
        REQUIRE(raw.Unwrap()[0] == Constants::UNCOMPRESSED_POINT_TAG);
    }
    SECTION("Wrong length is rejected") {
        std::vector<uint8_t> raw(65, 0x04);
        auto result = P384KeyAgreement::ImportPublicRaw(raw);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == FailureType::KeyAgreement);
    }
    SECTION("Point off the curve is rejected") {
        auto raw = P384KeyAgreement::ExportPublicRaw(key.Unwrap()).Unwrap();
        raw[50] ^= 0x01;
        auto result = P384KeyAgreement::ImportPublicRaw(raw);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == FailureType::KeyAgreement);
    }
}

TEST_CASE("P384KeyAgreement - JWK records", "[p384][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    auto key = P384KeyAgreement::GenerateKeyPair();
    REQUIRE(key.IsOk());

    SECTION("Private export carries d and re-imports to the same key") {
        auto jwk = P384KeyAgreement::ExportJwk(key.Unwrap(), true);
        REQUIRE(jwk.IsOk());
        REQUIRE(jwk.Unwrap().kty() == "EC");
        REQUIRE(jwk.Unwrap().crv() == "P-384");
        REQUIRE_FALSE(jwk.Unwrap().d().empty());

        auto restored = P384KeyAgreement::ImportJwk(jwk.Unwrap());
        REQUIRE(restored.IsOk());
        REQUIRE(restored.Unwrap().HasPrivate());
        REQUIRE(P384KeyAgreement::ExportPublicRaw(restored.Unwrap()).Unwrap() ==
                P384KeyAgreement::ExportPublicRaw(key.Unwrap()).Unwrap());
    }
    SECTION("Public export omits d") {
        auto jwk = P384KeyAgreement::ExportJwk(key.Unwrap(), false);
        REQUIRE(jwk.IsOk());
        REQUIRE(jwk.Unwrap().d().empty());
        auto restored = P384KeyAgreement::ImportJwk(jwk.Unwrap());
        REQUIRE(restored.IsOk());
        REQUIRE_FALSE(restored.Unwrap().HasPrivate());
    }
    SECTION("Private export of a public-only key fails") {
        auto raw = P384KeyAgreement::ExportPublicRaw(key.Unwrap());
        auto public_only = P384KeyAgreement::ImportPublicRaw(raw.Unwrap());
        REQUIRE(P384KeyAgreement::ExportJwk(public_only.Unwrap(), true).IsErr());
    }
    SECTION("Foreign curve is rejected") {
        auto jwk = P384KeyAgreement::ExportJwk(key.Unwrap(), false).Unwrap();
        jwk.set_crv("P-256");
        auto result = P384KeyAgreement::ImportJwk(jwk);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == FailureType::KeyAgreement);
    }
}
