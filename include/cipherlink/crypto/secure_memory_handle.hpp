#pragma once

#include "cipherlink/core/result.hpp"
#include "cipherlink/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <type_traits>
#include <vector>

namespace cipherlink::crypto {

/**
 * @brief Move-only owner of a sodium_malloc region
 *
 * The region is guard-paged, locked in RAM and zeroed when released.
 */
class SecureMemoryHandle {
public:
    [[nodiscard]] static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    /// Region of exactly data.size() bytes holding a copy of data
    [[nodiscard]] static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> data);

    SecureMemoryHandle() noexcept = default;
    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    /// Bytes past data.size() are zeroed
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    [[nodiscard]] Result<std::vector<uint8_t>, SodiumFailure> ReadBytes(size_t size) const;

    /// Lends the protected bytes to `reader` without copying them out
    template<typename F>
    auto WithReadAccess(F&& reader) const
        -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using Output = Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure>;
        if (IsInvalid()) {
            return Output::Err(Disposed());
        }
        return Output::Ok(std::forward<F>(reader)(std::span<const uint8_t>(region_.get(), size_)));
    }

    void Reset() noexcept;

    [[nodiscard]] bool IsInvalid() const noexcept { return region_ == nullptr; }
    [[nodiscard]] size_t Size() const noexcept { return size_; }

private:
    struct SodiumFree {
        void operator()(uint8_t* region) const noexcept;
    };

    SecureMemoryHandle(uint8_t* region, size_t size) noexcept;

    [[nodiscard]] static SodiumFailure Disposed();

    std::unique_ptr<uint8_t, SodiumFree> region_;
    size_t size_ = 0;
};

} // namespace cipherlink::crypto
