#include <catch2/catch_test_macros.hpp>
#include "cipherlink/crypto/sodium_interop.hpp"

#include <set>

using namespace cipherlink;
using namespace cipherlink::crypto;

TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Repeated Initialize is harmless") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::Initialize().IsOk());
    }
}

TEST_CASE("SodiumInterop - Secure wipe", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Empty buffer") {
        std::vector<uint8_t> buffer;
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
    }
    SECTION("Small buffer is zeroed") {
        std::vector<uint8_t> buffer(100, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(buffer == std::vector<uint8_t>(100, 0));
    }
    SECTION("Buffer above the small threshold is zeroed") {
        std::vector<uint8_t> buffer(Constants::SMALL_BUFFER_THRESHOLD * 4, 0xAB);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(buffer == std::vector<uint8_t>(Constants::SMALL_BUFFER_THRESHOLD * 4, 0));
    }
}

TEST_CASE("SodiumInterop - Constant time comparison", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    const std::vector<uint8_t> a = {1, 2, 3, 4, 5};
    SECTION("Equal buffers") {
        const std::vector<uint8_t> b = {1, 2, 3, 4, 5};
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap());
    }
    SECTION("Last byte differs") {
        const std::vector<uint8_t> b = {1, 2, 3, 4, 6};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap());
    }
    SECTION("Length differs") {
        const std::vector<uint8_t> b = {1, 2, 3, 4};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap());
    }
}

TEST_CASE("SodiumInterop - Randomness and identifiers", "[sodium][crypto][random]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("GetRandomBytes returns the requested size") {
        REQUIRE(SodiumInterop::GetRandomBytes(48).size() == 48);
        REQUIRE(SodiumInterop::GetRandomBytes(32) != SodiumInterop::GetRandomBytes(32));
    }
    SECTION("UUIDv4 layout") {
        const auto id = SodiumInterop::GenerateUuidV4();
        REQUIRE(id.size() == 36);
        REQUIRE(id[8] == '-');
        REQUIRE(id[13] == '-');
        REQUIRE(id[18] == '-');
        REQUIRE(id[23] == '-');
        REQUIRE(id[14] == '4');
        const char variant = id[19];
        REQUIRE((variant == '8' || variant == '9' || variant == 'a' || variant == 'b'));
    }
    SECTION("UUIDs do not repeat") {
        std::set<std::string> seen;
        for (int i = 0; i < 256; ++i) {
            seen.insert(SodiumInterop::GenerateUuidV4());
        }
        REQUIRE(seen.size() == 256);
    }
    SECTION("ToHex is lowercase") {
        const std::vector<uint8_t> bytes = {0x00, 0xAB, 0x7f};
        REQUIRE(SodiumInterop::ToHex(bytes) == "00ab7f");
    }
}
