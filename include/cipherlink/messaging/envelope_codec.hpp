#pragma once

#include "cipherlink/core/result.hpp"
#include "cipherlink/core/failures.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cipherlink::messaging {

struct UnpackedWire {
    /// Present only when the prefix byte was 97 and the input longer than 98 bytes
    std::optional<std::vector<uint8_t>> sender_public_key;
    std::vector<uint8_t> envelope;
};

/**
 * @brief Envelope encryption and wire framing
 *
 * Envelope: IV(12) || ciphertext || tag(16), AES-256-GCM.
 * Wire:     [len=97][raw P-384 key (97)][envelope], or the bare envelope
 *           when no key is attached.
 */
class EnvelopeCodec {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, CipherlinkFailure> Encode(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> key);

    [[nodiscard]] static Result<std::vector<uint8_t>, CipherlinkFailure> Encode(
        std::string_view plaintext,
        std::span<const uint8_t> key);

    /// Authentication failure on a wrong key or any tampering; never partial output
    [[nodiscard]] static Result<std::string, CipherlinkFailure> Decode(
        std::span<const uint8_t> envelope,
        std::span<const uint8_t> key);

    /// A key that is not exactly 97 bytes is not attached
    [[nodiscard]] static std::vector<uint8_t> Pack(
        std::span<const uint8_t> envelope,
        std::span<const uint8_t> my_public_raw);

    [[nodiscard]] static UnpackedWire Unpack(std::span<const uint8_t> wire);

private:
    EnvelopeCodec() = delete;
};

} // namespace cipherlink::messaging
