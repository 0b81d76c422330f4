#pragma once

#include <cstddef>
#include <cstdint>

namespace cipherlink::configuration {

/// Argon2id cost parameters used to derive an account identity.
///
/// The parameters are part of the account: changing them changes every uuid
/// and master secret derived from a passphrase, so a node must use the
/// parameters that were stored alongside the account's salt.
///
/// @example
/// ```cpp
/// auto config = KdfConfig::Interactive();
/// argon2id_hash_raw(config.TimeCost(), config.MemoryKib(), config.Parallelism(), ...);
/// ```
class KdfConfig {
public:
    /// time=2, memory=16 MiB, parallelism=1, 64-byte output
    [[nodiscard]] static constexpr KdfConfig Interactive() noexcept {
        return KdfConfig(2, 16384, 1);
    }

    [[nodiscard]] static constexpr KdfConfig Default() noexcept {
        return Interactive();
    }

    /// Parameters received with a `salt_found` record
    [[nodiscard]] static constexpr KdfConfig FromStored(
        const uint32_t time_cost,
        const uint32_t memory_kib,
        const uint32_t parallelism) noexcept {
        return KdfConfig(time_cost, memory_kib, parallelism);
    }

    [[nodiscard]] constexpr uint32_t TimeCost() const noexcept { return time_cost_; }
    [[nodiscard]] constexpr uint32_t MemoryKib() const noexcept { return memory_kib_; }
    [[nodiscard]] constexpr uint32_t Parallelism() const noexcept { return parallelism_; }
    [[nodiscard]] constexpr size_t OutputSize() const noexcept { return output_size_; }

    /// Same costs, different hash length; identities always use OUTPUT_SIZE
    [[nodiscard]] constexpr KdfConfig WithOutputSize(const size_t output_size) const noexcept {
        KdfConfig resized = *this;
        resized.output_size_ = output_size;
        return resized;
    }

    [[nodiscard]] constexpr bool operator==(const KdfConfig& other) const noexcept {
        return time_cost_ == other.time_cost_ &&
               memory_kib_ == other.memory_kib_ &&
               parallelism_ == other.parallelism_ &&
               output_size_ == other.output_size_;
    }

    static constexpr size_t OUTPUT_SIZE = 64;

private:
    constexpr KdfConfig(const uint32_t time_cost, const uint32_t memory_kib, const uint32_t parallelism) noexcept
        : time_cost_(time_cost), memory_kib_(memory_kib), parallelism_(parallelism) {}

    uint32_t time_cost_;
    uint32_t memory_kib_;
    uint32_t parallelism_;
    size_t output_size_ = OUTPUT_SIZE;
};

} // namespace cipherlink::configuration
