#include "blockvault/crypto/password_key_derivation.hpp"
#include "blockvault/crypto/sodium_interop.hpp"
#include "blockvault/core/constants.hpp"
#include "blockvault/transfer/constants.hpp"
#include <openssl/evp.h>
#include <sodium.h>
#include <cstring>
#include <limits>
#include <string>

namespace blockvault::crypto {

    std::vector<uint8_t> PasswordKeyDerivation::BuildDeviceSalt(
        const std::string_view fingerprint,
        const std::span<const uint8_t> per_key_salt) {
        std::vector<uint8_t> material;
        material.reserve(kHardwareSaltLabel.size() + fingerprint.size() + per_key_salt.size());
        material.insert(material.end(), kHardwareSaltLabel.begin(), kHardwareSaltLabel.end());
        material.insert(material.end(), fingerprint.begin(), fingerprint.end());
        material.insert(material.end(), per_key_salt.begin(), per_key_salt.end());
        const auto digest = SodiumInterop::Sha256(material);
        return {digest.begin(), digest.end()};
    }

    Result<SecureMemoryHandle, TransferFailure> PasswordKeyDerivation::DeriveKey(
        const std::string_view secret,
        const std::string_view key_id,
        const std::span<const uint8_t> salt,
        const PasswordKdfParams& params) {
        if (secret.empty()) {
            return Result<SecureMemoryHandle, TransferFailure>::Err(
                TransferFailure::InvalidInput("Key derivation secret cannot be empty"));
        }
        if (salt.empty()) {
            return Result<SecureMemoryHandle, TransferFailure>::Err(
                TransferFailure::InvalidInput("Key derivation salt cannot be empty"));
        }

        std::vector<uint8_t> password;
        password.reserve(secret.size() + 1 + key_id.size());
        password.insert(password.end(), secret.begin(), secret.end());
        password.push_back(static_cast<uint8_t>(':'));
        password.insert(password.end(), key_id.begin(), key_id.end());

        std::vector<uint8_t> derived(KEY_SIZE);
        Result<Unit, TransferFailure> run_result = Result<Unit, TransferFailure>::Ok(unit);
        switch (params.algorithm) {
            case PasswordKdfAlgorithm::Pbkdf2HmacSha256:
                run_result = RunPbkdf2(password, salt, params.pbkdf2_iterations, derived);
                break;
            case PasswordKdfAlgorithm::Argon2id:
                run_result = RunArgon2id(password, salt, params.argon2_ops_limit,
                                         params.argon2_mem_limit, derived);
                break;
        }
        { auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(password)); (void)_wipe; }
        if (run_result.IsErr()) {
            { auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(derived)); (void)_wipe; }
            return Result<SecureMemoryHandle, TransferFailure>::Err(std::move(run_result).UnwrapErr());
        }

        auto handle_result = SecureMemoryHandle::FromBytes(derived);
        { auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(derived)); (void)_wipe; }
        if (handle_result.IsErr()) {
            return Result<SecureMemoryHandle, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        return Result<SecureMemoryHandle, TransferFailure>::Ok(std::move(handle_result).Unwrap());
    }

    Result<Unit, TransferFailure> PasswordKeyDerivation::RunPbkdf2(
        const std::span<const uint8_t> password,
        const std::span<const uint8_t> salt,
        const uint32_t iterations,
        const std::span<uint8_t> output) {
        if (iterations < kMinPbkdf2Iterations ||
            iterations > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput(
                    "PBKDF2 iteration count out of range: " + std::to_string(iterations)));
        }
        const int rc = PKCS5_PBKDF2_HMAC(
            reinterpret_cast<const char*>(password.data()),
            static_cast<int>(password.size()),
            salt.data(),
            static_cast<int>(salt.size()),
            static_cast<int>(iterations),
            EVP_sha256(),
            static_cast<int>(output.size()),
            output.data());
        if (rc != OpenSSLConstants::SUCCESS) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::DeriveKey("PBKDF2-HMAC-SHA256 derivation failed"));
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    Result<Unit, TransferFailure> PasswordKeyDerivation::RunArgon2id(
        const std::span<const uint8_t> password,
        const std::span<const uint8_t> salt,
        const uint64_t ops_limit,
        const size_t mem_limit,
        const std::span<uint8_t> output) {
        static_assert(crypto_pwhash_SALTBYTES == ARGON2_SALT_SIZE);
        if (salt.size() < ARGON2_SALT_SIZE) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("Argon2id salt must be at least 16 bytes"));
        }
        const int rc = crypto_pwhash(
            output.data(),
            output.size(),
            reinterpret_cast<const char*>(password.data()),
            password.size(),
            salt.data(),
            ops_limit,
            mem_limit,
            crypto_pwhash_ALG_ARGON2ID13);
        if (rc != 0) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::DeriveKey("Argon2id derivation failed (out of memory?)"));
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }

}
