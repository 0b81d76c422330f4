#include "cipherlink/crypto/secure_memory_handle.hpp"
#include "cipherlink/crypto/sodium_interop.hpp"
#include "cipherlink/core/constants.hpp"
#include "cipherlink/core/format.hpp"

#include <algorithm>
#include <utility>

namespace cipherlink::crypto {

void SecureMemoryHandle::SodiumFree::operator()(uint8_t* region) const noexcept {
    // sodium_free zeroes the region before unmapping it
    SodiumInterop::FreeSecure(region);
}

SecureMemoryHandle::SecureMemoryHandle(uint8_t* region, const size_t size) noexcept
    : region_(region)
    , size_(size) {}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : region_(std::move(other.region_))
    , size_(std::exchange(other.size_, 0)) {}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    region_ = std::move(other.region_);
    size_ = std::exchange(other.size_, 0);
    return *this;
}

SodiumFailure SecureMemoryHandle::Disposed() {
    return SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED));
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(const size_t size) {
    using Allocation = Result<SecureMemoryHandle, SodiumFailure>;
    if (!SodiumInterop::IsInitialized()) {
        return Allocation::Err(SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (size == 0) {
        return Allocation::Err(SodiumFailure::AllocationFailed("Secure region of zero bytes requested"));
    }
    auto* region = static_cast<uint8_t*>(SodiumInterop::AllocateSecure(size));
    if (region == nullptr) {
        return Allocation::Err(SodiumFailure::AllocationFailed(
            compat::format("{} ({} bytes)", ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY, size)));
    }
    return Allocation::Ok(SecureMemoryHandle(region, size));
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::FromBytes(std::span<const uint8_t> data) {
    return Allocate(data.size()).Bind([data](SecureMemoryHandle handle) {
        return handle.Write(data).Map([&handle](Unit) { return std::move(handle); });
    });
}

void SecureMemoryHandle::Reset() noexcept {
    region_.reset();
    size_ = 0;
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(Disposed());
    }
    if (data.size() > size_) {
        return Result<Unit, SodiumFailure>::Err(SodiumFailure::BufferTooSmall(
            compat::format("{}: {} > {}", ErrorMessages::DATA_EXCEEDS_BUFFER, data.size(), size_)));
    }
    const auto tail = std::copy(data.begin(), data.end(), region_.get());
    std::fill(tail, region_.get() + size_, uint8_t{0});
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SodiumFailure> SecureMemoryHandle::ReadBytes(const size_t size) const {
    if (IsInvalid()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(Disposed());
    }
    if (size > size_) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(SodiumFailure::BufferTooSmall(
            compat::format("Read of {} bytes from a {} byte region", size, size_)));
    }
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(
        std::vector<uint8_t>(region_.get(), region_.get() + size));
}

} // namespace cipherlink::crypto
