#pragma once

#include "cipherlink/core/result.hpp"
#include "cipherlink/core/failures.hpp"
#include "cipherlink/core/constants.hpp"

#include <sodium.h>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace cipherlink::crypto {

/**
 * @brief Process-wide libsodium services
 *
 * Every other crypto class assumes Initialize() has succeeded once.
 */
class SodiumInterop {
public:
    SodiumInterop() = delete;

    /// Safe to call from any thread, any number of times
    static Result<Unit, SodiumFailure> Initialize();
    static bool IsInitialized() noexcept;

    /// Zeroes the buffer; large buffers go through sodium_memzero
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /// Different lengths compare unequal without reading either buffer
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /// Random RFC 4122 version 4 identifier, lowercase and hyphenated
    static std::string GenerateUuidV4();

    static std::string ToHex(std::span<const uint8_t> bytes);

    /// Guarded allocation; nullptr before Initialize() or when out of memory
    static void* AllocateSecure(size_t size) noexcept;
    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = Constants::MAX_BUFFER_SIZE;
};

} // namespace cipherlink::crypto
