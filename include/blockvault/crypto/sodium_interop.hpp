#pragma once

#include "blockvault/core/result.hpp"
#include "blockvault/core/failures.hpp"
#include "blockvault/core/constants.hpp"

#include <sodium.h>
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace blockvault::crypto {

/**
 * @brief Interop layer for libsodium operations
 *
 * Initialization, secure wiping, constant-time comparison, the CSPRNG,
 * SHA-256 and guarded allocation. Everything else in the library reaches
 * libsodium through this class.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Must be called before any other sodium operations.
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are zeroed through a volatile pointer, larger ones
     * with sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    static Result<Unit, SodiumFailure> SecureWipe(std::span<const uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return Ok(true) if equal, Ok(false) if different, Err on failure
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Hashing
    // ========================================================================

    /**
     * @brief SHA-256 of @p data (crypto_hash_sha256)
     */
    static std::array<uint8_t, Constants::SHA_256_DIGEST_SIZE> Sha256(
        std::span<const uint8_t> data);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /**
     * @brief Random lowercase hex string of @p byte_count random bytes
     */
    static std::string GetRandomHex(size_t byte_count);

    static uint32_t GenerateRandomUInt32(bool ensure_non_zero = false);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate secure memory using sodium_malloc
     *
     * Guard-paged, locked in RAM, zeroed on free.
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace blockvault::crypto
