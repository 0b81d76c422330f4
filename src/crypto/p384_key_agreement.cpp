#include "cipherlink/crypto/p384_key_agreement.hpp"
#include "cipherlink/crypto/base64.hpp"
#include "cipherlink/crypto/digest.hpp"
#include "cipherlink/crypto/openssl_error.hpp"
#include "cipherlink/crypto/sodium_interop.hpp"
#include "cipherlink/core/constants.hpp"
#include "cipherlink/core/format.hpp"

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/param_build.h>

#include <algorithm>

namespace cipherlink::crypto {
using OpenSSL = OpenSSLConstants;

namespace {
    struct EVP_PKEY_CTX_Deleter {
        void operator()(EVP_PKEY_CTX* ctx) const {
            if (ctx) {
                EVP_PKEY_CTX_free(ctx);
            }
        }
    };
    using EVP_PKEY_CTX_ptr = std::unique_ptr<EVP_PKEY_CTX, EVP_PKEY_CTX_Deleter>;

    struct ParamBuildDeleter {
        void operator()(OSSL_PARAM_BLD* bld) const { OSSL_PARAM_BLD_free(bld); }
    };
    struct ParamDeleter {
        void operator()(OSSL_PARAM* params) const { OSSL_PARAM_free(params); }
    };
    struct BignumDeleter {
        void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
    };
    using BIGNUM_ptr = std::unique_ptr<BIGNUM, BignumDeleter>;

    using KeyResult = Result<P384Key, CipherlinkFailure>;

    CipherlinkFailure KeyAgreementFailure(const std::string_view what) {
        return CipherlinkFailure::KeyAgreement(compat::format("{}: {}", what, LastOpenSSLError()));
    }

    Result<Unit, CipherlinkFailure> ValidateRawPoint(std::span<const uint8_t> raw) {
        if (raw.size() != Constants::P_384_RAW_PUBLIC_KEY_SIZE) {
            return Result<Unit, CipherlinkFailure>::Err(CipherlinkFailure::KeyAgreement(
                compat::format("P-384 public key must be {} bytes, got {}",
                    Constants::P_384_RAW_PUBLIC_KEY_SIZE, raw.size())));
        }
        if (raw[0] != Constants::UNCOMPRESSED_POINT_TAG) {
            return Result<Unit, CipherlinkFailure>::Err(CipherlinkFailure::KeyAgreement(
                "P-384 public key is not an uncompressed point"));
        }
        return Result<Unit, CipherlinkFailure>::Ok(unit);
    }

    /// Build an EC key from its encoded point and optional private scalar, then check it
    KeyResult BuildKey(std::span<const uint8_t> raw_point, const BIGNUM* private_scalar) {
        std::unique_ptr<OSSL_PARAM_BLD, ParamBuildDeleter> bld(OSSL_PARAM_BLD_new());
        if (!bld) {
            return KeyResult::Err(KeyAgreementFailure("Failed to create parameter builder"));
        }
        const std::string curve(OpenSSL::CURVE_P_384);
        if (OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, curve.c_str(), 0) != OpenSSL::SUCCESS ||
            OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                             raw_point.data(), raw_point.size()) != OpenSSL::SUCCESS) {
            return KeyResult::Err(KeyAgreementFailure("Failed to encode public key parameters"));
        }
        if (private_scalar != nullptr &&
            OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_PRIV_KEY, private_scalar) != OpenSSL::SUCCESS) {
            return KeyResult::Err(KeyAgreementFailure("Failed to encode private key parameter"));
        }
        std::unique_ptr<OSSL_PARAM, ParamDeleter> params(OSSL_PARAM_BLD_to_param(bld.get()));
        if (!params) {
            return KeyResult::Err(KeyAgreementFailure("Failed to build key parameters"));
        }

        const std::string key_type(OpenSSL::KEY_TYPE_EC);
        EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_name(nullptr, key_type.c_str(), nullptr));
        if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != OpenSSL::SUCCESS) {
            return KeyResult::Err(KeyAgreementFailure("Failed to initialize key import"));
        }
        EVP_PKEY* raw_key = nullptr;
        const int selection = private_scalar != nullptr ? EVP_PKEY_KEYPAIR : EVP_PKEY_PUBLIC_KEY;
        if (EVP_PKEY_fromdata(ctx.get(), &raw_key, selection, params.get()) != OpenSSL::SUCCESS) {
            return KeyResult::Err(KeyAgreementFailure("Point is not a valid P-384 key"));
        }
        P384Key key(raw_key, private_scalar != nullptr);

        EVP_PKEY_CTX_ptr check(EVP_PKEY_CTX_new_from_pkey(nullptr, key.Native(), nullptr));
        if (!check) {
            return KeyResult::Err(KeyAgreementFailure("Failed to create key check context"));
        }
        const int valid = private_scalar != nullptr
            ? EVP_PKEY_pairwise_check(check.get())
            : EVP_PKEY_public_check(check.get());
        if (valid != OpenSSL::SUCCESS) {
            return KeyResult::Err(KeyAgreementFailure("P-384 key failed validation"));
        }
        return KeyResult::Ok(std::move(key));
    }
}

Result<P384Key, CipherlinkFailure> P384KeyAgreement::GenerateKeyPair() {
    const std::string curve(OpenSSL::CURVE_P_384);
    EVP_PKEY* raw_key = EVP_EC_gen(curve.c_str());
    if (raw_key == nullptr) {
        return KeyResult::Err(KeyAgreementFailure("P-384 key generation failed"));
    }
    return KeyResult::Ok(P384Key(raw_key, true));
}

Result<std::vector<uint8_t>, CipherlinkFailure> P384KeyAgreement::ExportPublicRaw(const P384Key& key) {
    std::vector<uint8_t> raw(Constants::P_384_RAW_PUBLIC_KEY_SIZE);
    size_t written = 0;
    if (EVP_PKEY_get_octet_string_param(key.Native(), OSSL_PKEY_PARAM_PUB_KEY,
                                        raw.data(), raw.size(), &written) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, CipherlinkFailure>::Err(
            KeyAgreementFailure("Failed to export public point"));
    }
    raw.resize(written);
    if (auto valid = ValidateRawPoint(raw); valid.IsErr()) {
        return Result<std::vector<uint8_t>, CipherlinkFailure>::Err(std::move(valid).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, CipherlinkFailure>::Ok(std::move(raw));
}

Result<P384Key, CipherlinkFailure> P384KeyAgreement::ImportPublicRaw(std::span<const uint8_t> raw) {
    if (auto valid = ValidateRawPoint(raw); valid.IsErr()) {
        return KeyResult::Err(std::move(valid).UnwrapErr());
    }
    return BuildKey(raw, nullptr);
}

Result<proto::identity::EcKeyRecord, CipherlinkFailure> P384KeyAgreement::ExportJwk(
    const P384Key& key,
    const bool include_private) {
    using RecordResult = Result<proto::identity::EcKeyRecord, CipherlinkFailure>;

    if (include_private && !key.HasPrivate()) {
        return RecordResult::Err(CipherlinkFailure::InvalidState(std::string(ErrorMessages::NO_PRIVATE_KEY)));
    }
    auto raw = ExportPublicRaw(key);
    if (raw.IsErr()) {
        return RecordResult::Err(std::move(raw).UnwrapErr());
    }
    const auto& point = raw.Unwrap();
    const auto x = std::span<const uint8_t>(point).subspan(1, Constants::P_384_COORDINATE_SIZE);
    const auto y = std::span<const uint8_t>(point).subspan(1 + Constants::P_384_COORDINATE_SIZE);

    proto::identity::EcKeyRecord record;
    record.set_kty(std::string(OpenSSL::KEY_TYPE_EC));
    record.set_crv(std::string(OpenSSL::CURVE_P_384));
    record.set_x(Base64::EncodeUrl(x));
    record.set_y(Base64::EncodeUrl(y));

    if (include_private) {
        BIGNUM* raw_bn = nullptr;
        if (EVP_PKEY_get_bn_param(key.Native(), OSSL_PKEY_PARAM_PRIV_KEY, &raw_bn) != OpenSSL::SUCCESS) {
            return RecordResult::Err(KeyAgreementFailure("Failed to export private scalar"));
        }
        BIGNUM_ptr scalar(raw_bn);
        std::vector<uint8_t> d(Constants::P_384_COORDINATE_SIZE);
        if (BN_bn2binpad(scalar.get(), d.data(), static_cast<int>(d.size())) < 0) {
            return RecordResult::Err(KeyAgreementFailure("Private scalar does not fit 48 bytes"));
        }
        record.set_d(Base64::EncodeUrl(d));
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(d));
    }
    return RecordResult::Ok(std::move(record));
}

Result<P384Key, CipherlinkFailure> P384KeyAgreement::ImportJwk(const proto::identity::EcKeyRecord& record) {
    if (record.kty() != OpenSSL::KEY_TYPE_EC || record.crv() != OpenSSL::CURVE_P_384) {
        return KeyResult::Err(CipherlinkFailure::KeyAgreement(
            compat::format("Unsupported key {}/{}", record.kty(), record.crv())));
    }
    auto x = Base64::DecodeUrl(record.x());
    auto y = Base64::DecodeUrl(record.y());
    if (x.IsErr() || y.IsErr() ||
        x.Unwrap().size() != Constants::P_384_COORDINATE_SIZE ||
        y.Unwrap().size() != Constants::P_384_COORDINATE_SIZE) {
        return KeyResult::Err(CipherlinkFailure::KeyAgreement("Malformed P-384 coordinates"));
    }

    std::vector<uint8_t> point;
    point.reserve(Constants::P_384_RAW_PUBLIC_KEY_SIZE);
    point.push_back(Constants::UNCOMPRESSED_POINT_TAG);
    point.insert(point.end(), x.Unwrap().begin(), x.Unwrap().end());
    point.insert(point.end(), y.Unwrap().begin(), y.Unwrap().end());

    if (record.d().empty()) {
        return BuildKey(point, nullptr);
    }

    auto d = Base64::DecodeUrl(record.d());
    if (d.IsErr() || d.Unwrap().size() != Constants::P_384_COORDINATE_SIZE) {
        return KeyResult::Err(CipherlinkFailure::KeyAgreement("Malformed P-384 private scalar"));
    }
    auto& scalar_bytes = d.Unwrap();
    BIGNUM_ptr scalar(BN_bin2bn(scalar_bytes.data(), static_cast<int>(scalar_bytes.size()), nullptr));
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(scalar_bytes));
    if (!scalar) {
        return KeyResult::Err(KeyAgreementFailure("Failed to load private scalar"));
    }
    return BuildKey(point, scalar.get());
}

Result<std::string, CipherlinkFailure> P384KeyAgreement::DeriveSharedSecret(
    const P384Key& my_private,
    const P384Key& peer_public) {
    using SecretResult = Result<std::string, CipherlinkFailure>;

    if (!my_private.HasPrivate()) {
        return SecretResult::Err(CipherlinkFailure::KeyAgreement(std::string(ErrorMessages::NO_PRIVATE_KEY)));
    }
    EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, my_private.Native(), nullptr));
    if (!ctx) {
        return SecretResult::Err(KeyAgreementFailure("Failed to create derive context"));
    }
    if (EVP_PKEY_derive_init(ctx.get()) != OpenSSL::SUCCESS) {
        return SecretResult::Err(KeyAgreementFailure("Failed to initialize ECDH"));
    }
    if (EVP_PKEY_derive_set_peer(ctx.get(), peer_public.Native()) != OpenSSL::SUCCESS) {
        return SecretResult::Err(KeyAgreementFailure("Peer key rejected"));
    }
    size_t secret_len = 0;
    if (EVP_PKEY_derive(ctx.get(), nullptr, &secret_len) != OpenSSL::SUCCESS) {
        return SecretResult::Err(KeyAgreementFailure("Failed to query shared secret size"));
    }
    std::vector<uint8_t> shared(secret_len);
    if (EVP_PKEY_derive(ctx.get(), shared.data(), &secret_len) != OpenSSL::SUCCESS ||
        secret_len != Constants::P_384_SHARED_SECRET_SIZE) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(shared));
        return SecretResult::Err(KeyAgreementFailure("ECDH derivation failed"));
    }

    auto digest = Digest::Sha256(std::span<const uint8_t>(shared));
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(shared));
    std::string secret = Base64::Encode(digest);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(digest));
    return SecretResult::Ok(std::move(secret));
}

} // namespace cipherlink::crypto
