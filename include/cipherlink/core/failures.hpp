#pragma once
#include <string>
#include <string_view>
namespace cipherlink {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooLarge,
    BufferTooSmall,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    InvalidOperation
};
enum class FailureType {
    Generic,
    InvalidInput,
    Kdf,
    Authentication,
    KeyAgreement,
    Negotiation,
    MediaAcquisition,
    Encode,
    Decode,
    InvalidState,
    NotFound,
    Timeout,
    QueueFull
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/**
 * @brief Error value carried by every fallible cipherlink operation.
 *
 * Kdf, Authentication, KeyAgreement, Negotiation and MediaAcquisition map
 * one-to-one onto the failure classes callers are expected to branch on;
 * the remaining types describe malformed input or misuse.
 */
class CipherlinkFailure {
public:
    FailureType type;
    std::string message;
    CipherlinkFailure(const FailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static CipherlinkFailure Generic(std::string msg) {
        return {FailureType::Generic, std::move(msg)};
    }
    static CipherlinkFailure InvalidInput(std::string msg) {
        return {FailureType::InvalidInput, std::move(msg)};
    }
    static CipherlinkFailure Kdf(std::string msg) {
        return {FailureType::Kdf, std::move(msg)};
    }
    static CipherlinkFailure Authentication(std::string msg) {
        return {FailureType::Authentication, std::move(msg)};
    }
    static CipherlinkFailure KeyAgreement(std::string msg) {
        return {FailureType::KeyAgreement, std::move(msg)};
    }
    static CipherlinkFailure Negotiation(std::string msg) {
        return {FailureType::Negotiation, std::move(msg)};
    }
    static CipherlinkFailure MediaAcquisition(std::string msg) {
        return {FailureType::MediaAcquisition, std::move(msg)};
    }
    static CipherlinkFailure Encode(std::string msg) {
        return {FailureType::Encode, std::move(msg)};
    }
    static CipherlinkFailure Decode(std::string msg) {
        return {FailureType::Decode, std::move(msg)};
    }
    static CipherlinkFailure InvalidState(std::string msg) {
        return {FailureType::InvalidState, std::move(msg)};
    }
    static CipherlinkFailure NotFound(std::string msg) {
        return {FailureType::NotFound, std::move(msg)};
    }
    static CipherlinkFailure Timeout(std::string msg) {
        return {FailureType::Timeout, std::move(msg)};
    }
    static CipherlinkFailure QueueFull(std::string msg) {
        return {FailureType::QueueFull, std::move(msg)};
    }
    static CipherlinkFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
};

[[nodiscard]] inline std::string_view FailureTypeName(const FailureType type) noexcept {
    switch (type) {
        case FailureType::Generic: return "Generic";
        case FailureType::InvalidInput: return "InvalidInput";
        case FailureType::Kdf: return "Kdf";
        case FailureType::Authentication: return "Authentication";
        case FailureType::KeyAgreement: return "KeyAgreement";
        case FailureType::Negotiation: return "Negotiation";
        case FailureType::MediaAcquisition: return "MediaAcquisition";
        case FailureType::Encode: return "Encode";
        case FailureType::Decode: return "Decode";
        case FailureType::InvalidState: return "InvalidState";
        case FailureType::NotFound: return "NotFound";
        case FailureType::Timeout: return "Timeout";
        case FailureType::QueueFull: return "QueueFull";
    }
    return "Unknown";
}
}
