#pragma once
#include "blockvault/core/result.hpp"
#include "blockvault/core/failures.hpp"
#include "blockvault/crypto/sodium_secure_memory_handle.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
namespace blockvault::crypto {

enum class PasswordKdfAlgorithm : uint8_t {
    Pbkdf2HmacSha256 = 0,
    Argon2id = 1
};

struct PasswordKdfParams {
    PasswordKdfAlgorithm algorithm = PasswordKdfAlgorithm::Pbkdf2HmacSha256;
    uint32_t pbkdf2_iterations = 100'000;
    uint64_t argon2_ops_limit = 3;
    size_t argon2_mem_limit = 64 * 1024 * 1024;
};

/// Slow derivation of a 256-bit key from a low-entropy secret.
///
/// The password input is "<secret>:<key_id>" so that two keys derived from
/// the same licence on the same device still differ. The salt is built by
/// BuildDeviceSalt from the hardware fingerprint and a random per-key salt.
class PasswordKeyDerivation {
public:
    [[nodiscard]] static Result<SecureMemoryHandle, TransferFailure> DeriveKey(
        std::string_view secret,
        std::string_view key_id,
        std::span<const uint8_t> salt,
        const PasswordKdfParams& params);

    /// SHA-256(label || fingerprint || per_key_salt)
    [[nodiscard]] static std::vector<uint8_t> BuildDeviceSalt(
        std::string_view fingerprint,
        std::span<const uint8_t> per_key_salt);

    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t ARGON2_SALT_SIZE = 16;

private:
    static Result<Unit, TransferFailure> RunPbkdf2(
        std::span<const uint8_t> password,
        std::span<const uint8_t> salt,
        uint32_t iterations,
        std::span<uint8_t> output);
    static Result<Unit, TransferFailure> RunArgon2id(
        std::span<const uint8_t> password,
        std::span<const uint8_t> salt,
        uint64_t ops_limit,
        size_t mem_limit,
        std::span<uint8_t> output);

    PasswordKeyDerivation() = delete;
};
}
