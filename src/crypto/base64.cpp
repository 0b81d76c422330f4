#include "cipherlink/crypto/base64.hpp"
#include "cipherlink/core/constants.hpp"

#include <sodium.h>

namespace cipherlink::crypto {

namespace {
    std::string EncodeVariant(std::span<const uint8_t> bytes, const int variant) {
        const size_t encoded_len = sodium_base64_encoded_len(bytes.size(), variant);
        std::string out(encoded_len, '\0');
        sodium_bin2base64(out.data(), out.size(), bytes.data(), bytes.size(), variant);
        // encoded_len counts the terminating NUL
        out.resize(encoded_len - 1);
        return out;
    }

    Result<std::vector<uint8_t>, CipherlinkFailure> DecodeVariant(
        const std::string_view text,
        const int variant) {
        std::vector<uint8_t> out(text.size() / 4 * 3 + 3);
        size_t decoded_len = 0;
        if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(),
                              nullptr, &decoded_len, nullptr, variant) != SodiumConstants::SUCCESS) {
            return Result<std::vector<uint8_t>, CipherlinkFailure>::Err(
                CipherlinkFailure::Decode("Invalid base64 input"));
        }
        out.resize(decoded_len);
        return Result<std::vector<uint8_t>, CipherlinkFailure>::Ok(std::move(out));
    }
}

std::string Base64::Encode(std::span<const uint8_t> bytes) {
    return EncodeVariant(bytes, sodium_base64_VARIANT_ORIGINAL);
}

Result<std::vector<uint8_t>, CipherlinkFailure> Base64::Decode(const std::string_view text) {
    return DecodeVariant(text, sodium_base64_VARIANT_ORIGINAL);
}

std::string Base64::EncodeUrl(std::span<const uint8_t> bytes) {
    return EncodeVariant(bytes, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
}

Result<std::vector<uint8_t>, CipherlinkFailure> Base64::DecodeUrl(const std::string_view text) {
    return DecodeVariant(text, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
}

} // namespace cipherlink::crypto
