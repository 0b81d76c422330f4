#include "cipherlink/messaging/envelope_codec.hpp"
#include "cipherlink/crypto/aes_gcm.hpp"
#include "cipherlink/crypto/sodium_interop.hpp"
#include "cipherlink/core/constants.hpp"
#include "cipherlink/core/format.hpp"

namespace cipherlink::messaging {

Result<std::vector<uint8_t>, CipherlinkFailure> EnvelopeCodec::Encode(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> key) {
    using EncodeResult = Result<std::vector<uint8_t>, CipherlinkFailure>;

    if (plaintext.size() > WireConstants::MAX_PAYLOAD_SIZE) {
        return EncodeResult::Err(CipherlinkFailure::Encode(
            compat::format("Payload of {} bytes exceeds {}", plaintext.size(), WireConstants::MAX_PAYLOAD_SIZE)));
    }
    const auto iv = crypto::SodiumInterop::GetRandomBytes(Constants::AES_GCM_NONCE_SIZE);
    auto sealed = crypto::AesGcm::Encrypt(key, iv, plaintext);
    if (sealed.IsErr()) {
        return sealed;
    }
    const auto& ciphertext = sealed.Unwrap();

    std::vector<uint8_t> envelope;
    envelope.reserve(iv.size() + ciphertext.size());
    envelope.insert(envelope.end(), iv.begin(), iv.end());
    envelope.insert(envelope.end(), ciphertext.begin(), ciphertext.end());
    return EncodeResult::Ok(std::move(envelope));
}

Result<std::vector<uint8_t>, CipherlinkFailure> EnvelopeCodec::Encode(
    const std::string_view plaintext,
    std::span<const uint8_t> key) {
    return Encode(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(plaintext.data()), plaintext.size()),
        key);
}

Result<std::string, CipherlinkFailure> EnvelopeCodec::Decode(
    std::span<const uint8_t> envelope,
    std::span<const uint8_t> key) {
    using DecodeResult = Result<std::string, CipherlinkFailure>;

    if (envelope.size() < WireConstants::MIN_ENVELOPE_SIZE) {
        return DecodeResult::Err(CipherlinkFailure::Decode(
            compat::format("{}: {} bytes", ErrorMessages::CIPHERTEXT_TOO_SMALL, envelope.size())));
    }
    const auto iv = envelope.subspan(0, Constants::AES_GCM_NONCE_SIZE);
    const auto body = envelope.subspan(Constants::AES_GCM_NONCE_SIZE);

    auto opened = crypto::AesGcm::Decrypt(key, iv, body);
    if (opened.IsErr()) {
        return DecodeResult::Err(std::move(opened).UnwrapErr());
    }
    auto& plaintext = opened.Unwrap();
    std::string text(plaintext.begin(), plaintext.end());
    (void)crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(plaintext));
    return DecodeResult::Ok(std::move(text));
}

std::vector<uint8_t> EnvelopeCodec::Pack(
    std::span<const uint8_t> envelope,
    std::span<const uint8_t> my_public_raw) {
    if (my_public_raw.size() != Constants::P_384_RAW_PUBLIC_KEY_SIZE) {
        return {envelope.begin(), envelope.end()};
    }
    std::vector<uint8_t> wire;
    wire.reserve(WireConstants::KEYED_HEADER_SIZE + envelope.size());
    wire.push_back(static_cast<uint8_t>(my_public_raw.size()));
    wire.insert(wire.end(), my_public_raw.begin(), my_public_raw.end());
    wire.insert(wire.end(), envelope.begin(), envelope.end());
    return wire;
}

UnpackedWire EnvelopeCodec::Unpack(std::span<const uint8_t> wire) {
    UnpackedWire unpacked;
    if (wire.size() > WireConstants::KEYED_HEADER_SIZE &&
        wire[0] == Constants::P_384_RAW_PUBLIC_KEY_SIZE) {
        const auto key = wire.subspan(WireConstants::KEY_LENGTH_PREFIX_SIZE, Constants::P_384_RAW_PUBLIC_KEY_SIZE);
        const auto rest = wire.subspan(WireConstants::KEYED_HEADER_SIZE);
        unpacked.sender_public_key.emplace(key.begin(), key.end());
        unpacked.envelope.assign(rest.begin(), rest.end());
        return unpacked;
    }
    unpacked.envelope.assign(wire.begin(), wire.end());
    return unpacked;
}

} // namespace cipherlink::messaging
