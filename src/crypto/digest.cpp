#include "cipherlink/crypto/digest.hpp"

#include <sodium.h>

namespace cipherlink::crypto {

Digest::Sha256Hash Digest::Sha256(std::span<const uint8_t> data) {
    Sha256Hash out{};
    crypto_hash_sha256(out.data(), data.data(), data.size());
    return out;
}

Digest::Sha256Hash Digest::Sha256(const std::string_view text) {
    return Sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

std::vector<uint8_t> Digest::GenericHash(std::span<const uint8_t> data, const size_t output_size) {
    std::vector<uint8_t> out(output_size);
    crypto_generichash(out.data(), out.size(), data.data(), data.size(), nullptr, 0);
    return out;
}

} // namespace cipherlink::crypto
