#pragma once

#include "cipherlink/core/result.hpp"
#include "cipherlink/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cipherlink::crypto {

/// Standard padded base64 (RFC 4648 section 4), the alphabet shared secrets are exchanged in
class Base64 {
public:
    static std::string Encode(std::span<const uint8_t> bytes);

    [[nodiscard]] static Result<std::vector<uint8_t>, CipherlinkFailure> Decode(std::string_view text);

    /// Unpadded base64url, as used by JWK members
    static std::string EncodeUrl(std::span<const uint8_t> bytes);

    [[nodiscard]] static Result<std::vector<uint8_t>, CipherlinkFailure> DecodeUrl(std::string_view text);

private:
    Base64() = delete;
};

} // namespace cipherlink::crypto
