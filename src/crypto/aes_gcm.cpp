#include "cipherlink/crypto/aes_gcm.hpp"
#include "cipherlink/crypto/sodium_interop.hpp"
#include "cipherlink/crypto/openssl_error.hpp"
#include "cipherlink/core/constants.hpp"
#include "cipherlink/core/format.hpp"

#include <openssl/evp.h>

#include <memory>
#include <optional>

namespace cipherlink::crypto {

using OpenSSL = OpenSSLConstants;

namespace {
    using BytesResult = Result<std::vector<uint8_t>, CipherlinkFailure>;

    struct CipherContextFree {
        void operator()(EVP_CIPHER_CTX* context) const noexcept { EVP_CIPHER_CTX_free(context); }
    };
    using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, CipherContextFree>;

    enum class Direction : int {
        Decrypt = 0,
        Encrypt = 1
    };

    CipherlinkFailure OpenSSLFailure(const std::string_view step) {
        return CipherlinkFailure::Generic(compat::format("AES-GCM {} failed: {}", step, LastOpenSSLError()));
    }

    std::optional<CipherlinkFailure> CheckSizes(std::span<const uint8_t> key, std::span<const uint8_t> nonce) {
        if (key.size() != Constants::AES_KEY_SIZE) {
            return CipherlinkFailure::InvalidInput(
                compat::format("AES-256 key is {} bytes, expected {}", key.size(), Constants::AES_KEY_SIZE));
        }
        if (nonce.size() != Constants::AES_GCM_NONCE_SIZE) {
            return CipherlinkFailure::InvalidInput(
                compat::format("GCM nonce is {} bytes, expected {}", nonce.size(), Constants::AES_GCM_NONCE_SIZE));
        }
        return std::nullopt;
    }

    /// Keyed context with the associated data already absorbed
    Result<CipherContext, CipherlinkFailure> Prepare(
        const Direction direction,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> associated_data) {
        using Prepared = Result<CipherContext, CipherlinkFailure>;
        const int enc = static_cast<int>(direction);

        CipherContext context(EVP_CIPHER_CTX_new());
        if (!context) {
            return Prepared::Err(OpenSSLFailure("context allocation"));
        }
        if (EVP_CipherInit_ex(context.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr, enc) != OpenSSL::SUCCESS ||
            EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_IVLEN,
                                static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS ||
            EVP_CipherInit_ex(context.get(), nullptr, nullptr, key.data(), nonce.data(), enc) != OpenSSL::SUCCESS) {
            return Prepared::Err(OpenSSLFailure("setup"));
        }
        if (!associated_data.empty()) {
            int absorbed = 0;
            if (EVP_CipherUpdate(context.get(), nullptr, &absorbed, associated_data.data(),
                                 static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
                return Prepared::Err(OpenSSLFailure("associated data"));
            }
        }
        return Prepared::Ok(std::move(context));
    }

    void Discard(std::vector<uint8_t>& buffer) noexcept {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        buffer.clear();
    }
}

Result<std::vector<uint8_t>, CipherlinkFailure> AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto invalid = CheckSizes(key, nonce)) {
        return BytesResult::Err(std::move(*invalid));
    }
    auto prepared = Prepare(Direction::Encrypt, key, nonce, associated_data);
    if (prepared.IsErr()) {
        return BytesResult::Err(std::move(prepared).UnwrapErr());
    }
    auto& context = prepared.Unwrap();

    // ciphertext || tag
    std::vector<uint8_t> sealed(plaintext.size() + Constants::AES_GCM_TAG_SIZE);
    int written = 0;
    int finished = 0;
    if (EVP_CipherUpdate(context.get(), sealed.data(), &written, plaintext.data(),
                         static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS ||
        EVP_CipherFinal_ex(context.get(), sealed.data() + written, &finished) != OpenSSL::SUCCESS) {
        Discard(sealed);
        return BytesResult::Err(OpenSSLFailure("encryption"));
    }
    const auto body = static_cast<size_t>(written + finished);
    if (EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                            sealed.data() + body) != OpenSSL::SUCCESS) {
        Discard(sealed);
        return BytesResult::Err(OpenSSLFailure("tag extraction"));
    }
    sealed.resize(body + Constants::AES_GCM_TAG_SIZE);
    return BytesResult::Ok(std::move(sealed));
}

Result<std::vector<uint8_t>, CipherlinkFailure> AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto invalid = CheckSizes(key, nonce)) {
        return BytesResult::Err(std::move(*invalid));
    }
    if (ciphertext_with_tag.size() < Constants::AES_GCM_TAG_SIZE) {
        return BytesResult::Err(CipherlinkFailure::Decode(compat::format(
            "{}: {} bytes cannot hold a {} byte tag",
            ErrorMessages::CIPHERTEXT_TOO_SMALL, ciphertext_with_tag.size(), Constants::AES_GCM_TAG_SIZE)));
    }
    const size_t body = ciphertext_with_tag.size() - Constants::AES_GCM_TAG_SIZE;
    const auto ciphertext = ciphertext_with_tag.first(body);
    // EVP_CTRL_GCM_SET_TAG takes a mutable pointer
    std::vector<uint8_t> tag(ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(body), ciphertext_with_tag.end());

    auto prepared = Prepare(Direction::Decrypt, key, nonce, associated_data);
    if (prepared.IsErr()) {
        return BytesResult::Err(std::move(prepared).UnwrapErr());
    }
    auto& context = prepared.Unwrap();

    std::vector<uint8_t> opened(body);
    int written = 0;
    if (EVP_CipherUpdate(context.get(), opened.data(), &written, ciphertext.data(),
                         static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS ||
        EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()),
                            tag.data()) != OpenSSL::SUCCESS) {
        Discard(opened);
        return BytesResult::Err(OpenSSLFailure("decryption"));
    }
    int finished = 0;
    if (EVP_CipherFinal_ex(context.get(), opened.data() + written, &finished) != OpenSSL::SUCCESS) {
        // Tag mismatch: nothing decrypted may leave this function
        Discard(opened);
        ERR_clear_error();
        return BytesResult::Err(
            CipherlinkFailure::Authentication(std::string(ErrorMessages::AES_GCM_AUTHENTICATION_FAILED)));
    }
    opened.resize(static_cast<size_t>(written + finished));
    return BytesResult::Ok(std::move(opened));
}

} // namespace cipherlink::crypto
