#pragma once

#include "cipherlink/core/constants.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace cipherlink::crypto {

class Digest {
public:
    using Sha256Hash = std::array<uint8_t, Constants::SHA_256_DIGEST_SIZE>;

    static Sha256Hash Sha256(std::span<const uint8_t> data);

    /// SHA-256 over the UTF-8 bytes of text
    static Sha256Hash Sha256(std::string_view text);

    /// Unkeyed BLAKE2b with the requested output size (16..64 bytes)
    static std::vector<uint8_t> GenericHash(std::span<const uint8_t> data, size_t output_size);

private:
    Digest() = delete;
};

} // namespace cipherlink::crypto
