#include "blockvault/crypto/sodium_interop.hpp"
#include "blockvault/core/logging.hpp"

#include <cstring>

namespace blockvault::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        if (sodium_init() < 0) {
            initialized_.store(false, std::memory_order_release);
        } else {
            initialized_.store(true, std::memory_order_release);
        }
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > Constants::MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                "Buffer size " + std::to_string(buffer.size()) +
                " exceeds maximum " + std::to_string(Constants::MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<const uint8_t> buffer) {
    return SecureWipe(std::span<uint8_t>(
        const_cast<uint8_t*>(buffer.data()),
        buffer.size()));
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(
            SodiumFailure::ComparisonFailed(
                std::string(ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED) + ": " +
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }

    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }

    const int result = sodium_memcmp(a.data(), b.data(), a.size());
    return Result<bool, SodiumFailure>::Ok(result == 0);
}

// ============================================================================
// Hashing
// ============================================================================

std::array<uint8_t, Constants::SHA_256_DIGEST_SIZE> SodiumInterop::Sha256(
    std::span<const uint8_t> data) {
    static_assert(crypto_hash_sha256_BYTES == Constants::SHA_256_DIGEST_SIZE);
    std::array<uint8_t, Constants::SHA_256_DIGEST_SIZE> digest{};
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

std::string SodiumInterop::GetRandomHex(size_t byte_count) {
    const auto bytes = GetRandomBytes(byte_count);
    return logging::ToHex(bytes);
}

uint32_t SodiumInterop::GenerateRandomUInt32(bool ensure_non_zero) {
    uint32_t value;
    do {
        value = randombytes_random();
    } while (ensure_non_zero && value == 0);

    return value;
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace blockvault::crypto
