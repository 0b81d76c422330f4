#include <catch2/catch_test_macros.hpp>
#include "cipherlink/identity/account_identity.hpp"
#include "cipherlink/identity/identity_derivation_worker.hpp"
#include "cipherlink/crypto/sodium_interop.hpp"

#include <chrono>

using namespace cipherlink;
using namespace cipherlink::identity;

TEST_CASE("IdentityDerivation - Determinism", "[identity][kdf]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());

    auto first = IdentityDerivation::Derive("p1", "s1");
    auto second = IdentityDerivation::Derive("p1", "s1");
    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());

    SECTION("uuid is 64 lowercase hex characters") {
        const auto& uuid = first.Unwrap().uuid;
        REQUIRE(uuid.size() == 64);
        REQUIRE(uuid.find_first_not_of("0123456789abcdef") == std::string::npos);
    }
    SECTION("Same passphrase and salt give the same uuid and master secret") {
        REQUIRE(first.Unwrap().uuid == second.Unwrap().uuid);
        REQUIRE(first.Unwrap().master_secret.ReadBytes(32).Unwrap() ==
                second.Unwrap().master_secret.ReadBytes(32).Unwrap());
    }
    SECTION("A different salt gives a different identity") {
        auto other = IdentityDerivation::Derive("p1", "s2");
        REQUIRE(other.IsOk());
        REQUIRE(other.Unwrap().uuid != first.Unwrap().uuid);
    }
    SECTION("uuid and master secret come from different halves of the hash") {
        const auto secret = first.Unwrap().master_secret.ReadBytes(32).Unwrap();
        REQUIRE(crypto::SodiumInterop::ToHex(secret) != first.Unwrap().uuid);
    }
}

TEST_CASE("IdentityDerivation - Rejected input", "[identity][kdf]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());

    REQUIRE(IdentityDerivation::Derive("", "s1").UnwrapErr().type == FailureType::Kdf);
    REQUIRE(IdentityDerivation::Derive("p1", "").UnwrapErr().type == FailureType::Kdf);
}

TEST_CASE("AccountIdentity - Master secret lifetime", "[identity]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());

    auto derived = IdentityDerivation::Derive("p1", "s1");
    REQUIRE(derived.IsOk());
    AccountIdentity account(std::move(derived).Unwrap(), "alice");

    REQUIRE(account.DisplayName() == "alice");
    REQUIRE_FALSE(account.HasKeyPair());
    REQUIRE(account.MasterSecretBytes().Unwrap().size() == Constants::MASTER_SECRET_SIZE);

    account.Wipe();
    REQUIRE(account.IsWiped());
    auto after = account.MasterSecretBytes();
    REQUIRE(after.IsErr());
    REQUIRE(after.UnwrapErr().type == FailureType::InvalidState);
}

TEST_CASE("IdentityDerivationWorker - Background derivation", "[identity][kdf][concurrency]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());

    IdentityDerivationWorker worker;

    SECTION("Future resolves to the same identity as a direct call") {
        auto future = worker.Submit("p1", "s1");
        REQUIRE(future.wait_for(std::chrono::seconds(30)) == std::future_status::ready);
        auto result = future.get();
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().uuid == IdentityDerivation::Derive("p1", "s1").Unwrap().uuid);
    }
    SECTION("Queued jobs complete in submission order") {
        auto a = worker.Submit("p1", "s1");
        auto b = worker.Submit("p2", "s2");
        auto c = worker.Submit("", "s3");
        REQUIRE(a.get().IsOk());
        REQUIRE(b.get().IsOk());
        auto failed = c.get();
        REQUIRE(failed.IsErr());
        REQUIRE(failed.UnwrapErr().type == FailureType::Kdf);
    }
}
