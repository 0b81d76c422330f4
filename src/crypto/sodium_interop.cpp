#include "cipherlink/crypto/sodium_interop.hpp"
#include "cipherlink/core/format.hpp"

#include <atomic>

namespace cipherlink::crypto {

namespace {
    std::atomic<bool> sodium_ready{false};

    constexpr size_t UUID_BYTES = 16;

    SodiumFailure NotReady() {
        return SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED));
    }
}

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    // sodium_init() is itself idempotent; the static only keeps the first verdict
    static const bool initialized = sodium_init() >= 0;
    if (!initialized) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }
    sodium_ready.store(true, std::memory_order_release);
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return sodium_ready.load(std::memory_order_acquire);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(NotReady());
    }
    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(SodiumFailure::BufferTooLarge(
            compat::format("Cannot wipe {} bytes (limit {})", buffer.size(), MAX_BUFFER_SIZE)));
    }
    if (buffer.size() > Constants::SMALL_BUFFER_THRESHOLD) {
        sodium_memzero(buffer.data(), buffer.size());
    } else {
        volatile uint8_t* cursor = buffer.data();
        for (size_t remaining = buffer.size(); remaining > 0; --remaining) {
            *cursor++ = 0;
        }
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {
    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(NotReady());
    }
    const bool equal = a.size() == b.size() &&
        (a.empty() || sodium_memcmp(a.data(), b.data(), a.size()) == SodiumConstants::SUCCESS);
    return Result<bool, SodiumFailure>::Ok(equal);
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> random(size);
    if (size > 0) {
        randombytes_buf(random.data(), random.size());
    }
    return random;
}

std::string SodiumInterop::GenerateUuidV4() {
    auto bytes = GetRandomBytes(UUID_BYTES);
    // version nibble 4, variant bits 10
    bytes[6] = static_cast<uint8_t>(0x40 | (bytes[6] & 0x0F));
    bytes[8] = static_cast<uint8_t>(0x80 | (bytes[8] & 0x3F));

    std::string uuid = ToHex(bytes);
    for (const size_t dash : {20, 16, 12, 8}) {
        uuid.insert(dash, 1, '-');
    }
    return uuid;
}

std::string SodiumInterop::ToHex(std::span<const uint8_t> bytes) {
    // sodium_bin2hex writes a terminating NUL
    std::string hex(bytes.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.pop_back();
    return hex;
}

void* SodiumInterop::AllocateSecure(const size_t size) noexcept {
    return IsInitialized() ? sodium_malloc(size) : nullptr;
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    sodium_free(ptr);
}

} // namespace cipherlink::crypto
