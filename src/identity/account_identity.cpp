#include "cipherlink/identity/account_identity.hpp"
#include "cipherlink/crypto/argon2id.hpp"
#include "cipherlink/crypto/sodium_interop.hpp"
#include "cipherlink/core/constants.hpp"
#include "cipherlink/debug/event_logger.hpp"

namespace cipherlink::identity {

Result<DerivedIdentity, CipherlinkFailure> IdentityDerivation::Derive(
    const std::string_view passphrase,
    const std::string_view salt,
    const configuration::KdfConfig& config) {
    using DeriveResult = Result<DerivedIdentity, CipherlinkFailure>;

    auto hashed = crypto::Argon2id::Hash(passphrase, salt, config);
    if (hashed.IsErr()) {
        return DeriveResult::Err(std::move(hashed).UnwrapErr());
    }
    const auto& hash = hashed.Unwrap();

    auto split = hash.WithReadAccess([](std::span<const uint8_t> bytes) {
        const auto uuid_part = bytes.subspan(0, Constants::ACCOUNT_UUID_BYTES);
        const auto secret_part = bytes.subspan(Constants::ACCOUNT_UUID_BYTES, Constants::MASTER_SECRET_SIZE);
        return std::make_pair(
            crypto::SodiumInterop::ToHex(uuid_part),
            crypto::SecureMemoryHandle::FromBytes(secret_part));
    });
    if (split.IsErr()) {
        return DeriveResult::Err(CipherlinkFailure::FromSodiumFailure(split.UnwrapErr()));
    }
    auto [uuid, secret] = std::move(split).Unwrap();
    if (secret.IsErr()) {
        return DeriveResult::Err(CipherlinkFailure::FromSodiumFailure(secret.UnwrapErr()));
    }

    CIPHERLINK_LOG_PEER(debug::Component::Kdf, "identity derived", uuid, "");
    return DeriveResult::Ok(DerivedIdentity{std::move(uuid), std::move(secret).Unwrap()});
}

AccountIdentity::AccountIdentity(DerivedIdentity derived, std::string display_name)
    : uuid_(std::move(derived.uuid))
    , display_name_(std::move(display_name))
    , master_secret_(std::move(derived.master_secret)) {}

AccountIdentity::~AccountIdentity() {
    Wipe();
}

Result<std::vector<uint8_t>, CipherlinkFailure> AccountIdentity::MasterSecretBytes() const {
    auto bytes = master_secret_.ReadBytes(Constants::MASTER_SECRET_SIZE);
    if (bytes.IsErr()) {
        return Result<std::vector<uint8_t>, CipherlinkFailure>::Err(
            CipherlinkFailure::InvalidState(bytes.UnwrapErr().message));
    }
    return Result<std::vector<uint8_t>, CipherlinkFailure>::Ok(std::move(bytes).Unwrap());
}

void AccountIdentity::Wipe() noexcept {
    master_secret_.Reset();
    key_pair_.reset();
}

} // namespace cipherlink::identity
