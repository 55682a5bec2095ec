#pragma once

#include "blockvault/core/result.hpp"
#include "blockvault/core/failures.hpp"

#include <span>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace blockvault::crypto {

/**
 * @brief RAII owner of libsodium guarded memory holding key material
 *
 * Memory comes from sodium_malloc:
 * - Guard pages before/after
 * - Locked in RAM (no swap)
 * - Zeroed by sodium_free when the handle is destroyed
 *
 * Move-only. Every raw key in the library lives in one of these; plain
 * std::vector copies exist only for the duration of a single crypto call
 * and are wiped with SodiumInterop::SecureWipe afterwards.
 *
 * Example:
 * @code
 * auto handle = SecureMemoryHandle::FromBytes(key_bytes).Unwrap();
 * auto ok = handle.WithReadAccess([](std::span<const uint8_t> key) {
 *     return BlockCodec::Encrypt(key, nonce, plaintext, aad);
 * });
 * @endcode
 */
class SecureMemoryHandle {
public:
    // ========================================================================
    // Construction / Destruction
    // ========================================================================

    /**
     * @brief Allocate zero-filled secure memory
     *
     * @param size Number of bytes to allocate (must be > 0)
     */
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    /**
     * @brief Allocate a handle sized to @p data and copy it in
     *
     * The caller still owns (and should wipe) the source buffer.
     */
    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> data);

    ~SecureMemoryHandle();

    /**
     * @brief Creates an empty handle. Useful for containers.
     */
    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    // ========================================================================
    // Memory Operations
    // ========================================================================

    /**
     * @brief Write data to secure memory
     *
     * Bytes past data.size() are zeroed.
     */
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /**
     * @brief Copy the whole region into @p output (must be >= Size())
     */
    Result<Unit, SodiumFailure> Read(std::span<uint8_t> output) const;

    /**
     * @brief Zero the region and release it; the handle becomes invalid
     */
    void Wipe() noexcept;

    /**
     * @brief Execute a function with read-only access to the secure memory
     *
     * Avoids copying material out of guarded memory.
     */
    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }

        std::span<const uint8_t> secure_span(
            static_cast<const uint8_t*>(ptr_),
            size_);

        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    // ========================================================================
    // State Queries
    // ========================================================================

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void* ptr_;
    size_t size_;
};

} // namespace blockvault::crypto
