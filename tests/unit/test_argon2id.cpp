#include <catch2/catch_test_macros.hpp>
#include "cipherlink/crypto/argon2id.hpp"
#include "cipherlink/crypto/sodium_interop.hpp"

#include <string>

using namespace cipherlink;
using namespace cipherlink::crypto;
using configuration::KdfConfig;

namespace {
    std::vector<uint8_t> HashBytes(std::string_view passphrase, std::string_view salt) {
        auto hashed = Argon2id::Hash(passphrase, salt, KdfConfig::Interactive());
        REQUIRE(hashed.IsOk());
        return hashed.Unwrap().ReadBytes(KdfConfig::OUTPUT_SIZE).Unwrap();
    }
}

TEST_CASE("Argon2id - Parameters", "[argon2id][kdf]") {
    constexpr auto config = KdfConfig::Interactive();
    STATIC_REQUIRE(config.TimeCost() == 2);
    STATIC_REQUIRE(config.MemoryKib() == 16384);
    STATIC_REQUIRE(config.Parallelism() == 1);
    STATIC_REQUIRE(config.OutputSize() == 64);
    STATIC_REQUIRE(KdfConfig::Default() == config);
    STATIC_REQUIRE(config.WithOutputSize(32).OutputSize() == 32);
    STATIC_REQUIRE_FALSE(config.WithOutputSize(32) == config);
}

TEST_CASE("Argon2id - Hashing", "[argon2id][kdf]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Same inputs give the same 64 bytes") {
        const auto first = HashBytes("p1", "s1");
        const auto second = HashBytes("p1", "s1");
        REQUIRE(first.size() == 64);
        REQUIRE(first == second);
    }
    SECTION("Passphrase changes the output") {
        REQUIRE(HashBytes("p1", "s1") != HashBytes("p2", "s1"));
    }
    SECTION("Salt changes the output") {
        REQUIRE(HashBytes("p1", "s1") != HashBytes("p1", "s2"));
    }
    SECTION("Long salts are not truncated") {
        const std::string salt32 = "0123456789abcdef0123456789abcdef";
        REQUIRE(HashBytes("p1", salt32) == HashBytes("p1", salt32));
        REQUIRE(HashBytes("p1", salt32) != HashBytes("p1", salt32 + "x"));
        REQUIRE(HashBytes("p1", salt32) != HashBytes("p1", salt32.substr(0, 16)));
    }
}

TEST_CASE("Argon2id - Reference vector", "[argon2id][kdf]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    // Argon2id v19, t=2, m=2^16 KiB, p=1, 8-byte salt "somesalt", 32-byte tag
    const auto config = KdfConfig::FromStored(2, 1u << 16, 1).WithOutputSize(32);
    auto hashed = Argon2id::Hash("password", "somesalt", config);
    REQUIRE(hashed.IsOk());
    const auto tag = hashed.Unwrap().ReadBytes(32).Unwrap();
    REQUIRE(SodiumInterop::ToHex(tag) ==
            "09316115d5cf24ed5a15a31a3ba326e5cf32edc24702987c02b6566f61913cf7");
}

TEST_CASE("Argon2id - Rejected input", "[argon2id][kdf]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Empty passphrase") {
        auto result = Argon2id::Hash("", "salt", KdfConfig::Interactive());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == FailureType::Kdf);
    }
    SECTION("Empty salt") {
        auto result = Argon2id::Hash("pass", "", KdfConfig::Interactive());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == FailureType::Kdf);
    }
    SECTION("Zero lanes") {
        auto result = Argon2id::Hash("pass", "saltsalt", KdfConfig::FromStored(2, 16384, 0));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == FailureType::Kdf);
    }
}
